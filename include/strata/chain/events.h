// STRATA - Chain Events
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Notification bus for chain and mempool state changes. Callbacks run on
// the thread that caused the change, after the change is committed and
// with no chain or mempool lock held.

#ifndef STRATA_CHAIN_EVENTS_H
#define STRATA_CHAIN_EVENTS_H

#include "strata/core/block.h"
#include "strata/core/types.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace strata {

class ChainEvents {
public:
    using SubscriptionId = uint64_t;

    using NewTipCallback = std::function<void(int32_t height, const BlockHash& hash)>;
    using BlockConnectedCallback = std::function<void(const Block& block, int32_t height)>;
    using BlockDisconnectedCallback = std::function<void(const BlockHash& hash, const Block& block)>;
    using MempoolAcceptedCallback = std::function<void(const TxHash& txid)>;

    ChainEvents() = default;
    ChainEvents(const ChainEvents&) = delete;
    ChainEvents& operator=(const ChainEvents&) = delete;

    SubscriptionId SubscribeNewTip(NewTipCallback cb);
    SubscriptionId SubscribeBlockConnected(BlockConnectedCallback cb);
    SubscriptionId SubscribeBlockDisconnected(BlockDisconnectedCallback cb);
    SubscriptionId SubscribeMempoolAccepted(MempoolAcceptedCallback cb);

    /// False if id is unknown
    bool Unsubscribe(SubscriptionId id);

    size_t SubscriberCount() const;

    void NotifyNewTip(int32_t height, const BlockHash& hash) const;
    void NotifyBlockConnected(const Block& block, int32_t height) const;
    void NotifyBlockDisconnected(const BlockHash& hash, const Block& block) const;
    void NotifyMempoolAccepted(const TxHash& txid) const;

private:
    template<typename Cb>
    using Subscribers = std::vector<std::pair<SubscriptionId, Cb>>;

    mutable std::mutex mutex_;
    SubscriptionId nextId_{1};
    Subscribers<NewTipCallback> newTip_;
    Subscribers<BlockConnectedCallback> connected_;
    Subscribers<BlockDisconnectedCallback> disconnected_;
    Subscribers<MempoolAcceptedCallback> accepted_;
};

} // namespace strata

#endif // STRATA_CHAIN_EVENTS_H
