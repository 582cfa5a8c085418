// STRATA - Chain Events Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/events.h"
#include "strata/util/logging.h"
#include <algorithm>
#include <exception>

namespace strata {

namespace {

template<typename Vec>
bool EraseId(Vec& subscribers, ChainEvents::SubscriptionId id) {
    auto it = std::find_if(subscribers.begin(), subscribers.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == subscribers.end()) {
        return false;
    }
    subscribers.erase(it);
    return true;
}

/// Invoke every callback; one that throws is logged and the rest still run
template<typename Vec, typename... Args>
void Dispatch(const Vec& subscribers, const char* event, Args&&... args) {
    for (const auto& entry : subscribers) {
        try {
            entry.second(args...);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::CHAIN) << event << " subscriber " << entry.first
                                                << " threw: " << e.what();
        }
    }
}

} // namespace

ChainEvents::SubscriptionId ChainEvents::SubscribeNewTip(NewTipCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    newTip_.emplace_back(nextId_, std::move(cb));
    return nextId_++;
}

ChainEvents::SubscriptionId ChainEvents::SubscribeBlockConnected(BlockConnectedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_.emplace_back(nextId_, std::move(cb));
    return nextId_++;
}

ChainEvents::SubscriptionId ChainEvents::SubscribeBlockDisconnected(BlockDisconnectedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_.emplace_back(nextId_, std::move(cb));
    return nextId_++;
}

ChainEvents::SubscriptionId ChainEvents::SubscribeMempoolAccepted(MempoolAcceptedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    accepted_.emplace_back(nextId_, std::move(cb));
    return nextId_++;
}

bool ChainEvents::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return EraseId(newTip_, id) || EraseId(connected_, id) ||
           EraseId(disconnected_, id) || EraseId(accepted_, id);
}

size_t ChainEvents::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return newTip_.size() + connected_.size() + disconnected_.size() + accepted_.size();
}

// Subscriber lists are copied so callbacks may subscribe or notify again

void ChainEvents::NotifyNewTip(int32_t height, const BlockHash& hash) const {
    Subscribers<NewTipCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = newTip_;
    }
    Dispatch(subscribers, "NewTip", height, hash);
}

void ChainEvents::NotifyBlockConnected(const Block& block, int32_t height) const {
    Subscribers<BlockConnectedCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = connected_;
    }
    Dispatch(subscribers, "BlockConnected", block, height);
}

void ChainEvents::NotifyBlockDisconnected(const BlockHash& hash, const Block& block) const {
    Subscribers<BlockDisconnectedCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = disconnected_;
    }
    Dispatch(subscribers, "BlockDisconnected", hash, block);
}

void ChainEvents::NotifyMempoolAccepted(const TxHash& txid) const {
    Subscribers<MempoolAcceptedCallback> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = accepted_;
    }
    Dispatch(subscribers, "MempoolAccepted", txid);
}

} // namespace strata
