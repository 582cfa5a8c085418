// STRATA - Mempool Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/mempool/mempool.h"
#include "strata/chain/chainstate.h"
#include "strata/util/logging.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <ios>
#include <queue>
#include <sstream>

namespace strata {

// ============================================================================
// FeeRate Implementation
// ============================================================================

std::string FeeRate::ToString() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);
    ss << static_cast<double>(nSatoshisPerK) / 1000.0 << " per byte";
    return ss.str();
}

// ============================================================================
// MempoolEntry / MempoolAcceptResult
// ============================================================================

MempoolEntry::MempoolEntry(const TransactionRef& txIn, Amount feeIn, int64_t timeIn,
                           int32_t heightIn, uint64_t sequenceIn)
    : tx(txIn),
      fee(feeIn),
      size(txIn->GetTotalSize()),
      time(timeIn),
      entryHeight(heightIn),
      sequence(sequenceIn),
      countWithDescendants(1),
      sizeWithDescendants(txIn->GetTotalSize()),
      feesWithDescendants(feeIn) {}

std::string MempoolAcceptResult::ToString() const {
    if (accepted) {
        return "accepted " + txid.ToHex() + " fee " + std::to_string(fee);
    }
    if (error != MempoolError::NONE) {
        return strata::ToString(error) + ": " + rejectReason;
    }
    if (validation != ValidationError::NONE) {
        return strata::ToString(validation) + ": " + rejectReason;
    }
    return "rejected: " + rejectReason;
}

namespace {

/// Confirmed coins with in-pool outputs layered on top
class PoolCoinsView : public CoinsView {
public:
    PoolCoinsView(const CoinsView& base, const Mempool& pool, int32_t height)
        : base_(base), pool_(pool), height_(height) {}

    std::optional<Coin> GetCoin(const OutPoint& outpoint) const override {
        StorageError error;
        return FetchCoin(outpoint, error);
    }

    std::optional<Coin> FetchCoin(const OutPoint& outpoint, StorageError& error) const override {
        error = StorageError::NONE;
        if (auto coin = pool_.GetPoolCoin(outpoint, height_)) {
            return coin;
        }
        return base_.FetchCoin(outpoint, error);
    }

private:
    const CoinsView& base_;
    const Mempool& pool_;
    int32_t height_;
};

int64_t SystemNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ============================================================================
// PrioritizedView
// ============================================================================

PrioritizedView::PrioritizedView(std::unordered_map<TxHash, Item, Hash256Hasher> items,
                                 size_t maxBytes)
    : items_(std::move(items)), maxBytes_(maxBytes) {}

std::set<TxHash> PrioritizedView::PendingAncestors(const TxHash& txid) const {
    std::set<TxHash> result;
    std::queue<TxHash> toProcess;
    toProcess.push(txid);
    while (!toProcess.empty()) {
        const TxHash current = toProcess.front();
        toProcess.pop();
        auto it = items_.find(current);
        if (it == items_.end()) {
            continue;
        }
        for (const TxHash& parent : it->second.parents) {
            if (!done_.count(parent) && result.insert(parent).second) {
                toProcess.push(parent);
            }
        }
    }
    return result;
}

void PrioritizedView::Exclude(const TxHash& txid) {
    std::queue<TxHash> toProcess;
    toProcess.push(txid);
    while (!toProcess.empty()) {
        const TxHash current = toProcess.front();
        toProcess.pop();
        if (!done_.insert(current).second) {
            continue;
        }
        auto it = items_.find(current);
        if (it != items_.end()) {
            for (const TxHash& child : it->second.children) {
                toProcess.push(child);
            }
        }
    }
}

TransactionRef PrioritizedView::Next() {
    while (true) {
        if (queuePos_ < queue_.size()) {
            return queue_[queuePos_++];
        }
        queue_.clear();
        queuePos_ = 0;

        const Item* best = nullptr;
        TxHash bestId;
        std::set<TxHash> bestPackage;
        FeeRate bestRate;
        size_t bestSize = 0;

        for (const auto& entry : items_) {
            if (done_.count(entry.first)) {
                continue;
            }
            const Item& item = entry.second;
            std::set<TxHash> package = PendingAncestors(entry.first);
            Amount fees = item.fee;
            size_t size = item.size;
            for (const TxHash& anc : package) {
                const Item& a = items_.at(anc);
                fees += a.fee;
                size += a.size;
            }
            const FeeRate rate(fees, size);
            bool better = !best || rate > bestRate;
            if (best && rate == bestRate) {
                better = item.time < best->time ||
                         (item.time == best->time && item.sequence < best->sequence);
            }
            if (better) {
                best = &item;
                bestId = entry.first;
                bestPackage = std::move(package);
                bestRate = rate;
                bestSize = size;
            }
        }

        if (!best) {
            return nullptr;
        }
        if (used_ + bestSize > maxBytes_) {
            Exclude(bestId);
            continue;
        }

        // Parents first; among ready transactions, earliest insertion first
        bestPackage.insert(bestId);
        while (!bestPackage.empty()) {
            const Item* next = nullptr;
            TxHash nextId;
            for (const TxHash& id : bestPackage) {
                const Item& item = items_.at(id);
                const bool ready = std::none_of(
                    item.parents.begin(), item.parents.end(),
                    [&](const TxHash& p) { return bestPackage.count(p) > 0; });
                if (ready && (!next || item.sequence < next->sequence)) {
                    next = &item;
                    nextId = id;
                }
            }
            bestPackage.erase(nextId);
            done_.insert(nextId);
            queue_.push_back(next->tx);
            used_ += next->size;
        }
    }
}


// ============================================================================
// Mempool Construction
// ============================================================================

Mempool::Mempool(const CoinsView& chainView, const consensus::SignatureVerifier& verifier,
                 MempoolLimits limits, ChainStateManager* chain, int coinbaseMaturity)
    : chainView_(chainView),
      verifier_(verifier),
      limits_(std::move(limits)),
      chain_(chain),
      coinbaseMaturity_(coinbaseMaturity) {
    if (!chain_) {
        return;
    }
    ChainEvents& events = chain_->Events();
    subscriptions_.push_back(events.SubscribeBlockConnected(
        [this](const Block& block, int32_t) { RemoveForBlock(block); }));

    // Disconnected blocks arrive tip first; their transactions wait for the
    // new tip so a parent from a lower block goes back in before its child
    subscriptions_.push_back(events.SubscribeBlockDisconnected(
        [this](const BlockHash&, const Block& block) {
            std::vector<TransactionRef> txs;
            for (const auto& tx : block.vtx) {
                if (!tx->IsCoinBase()) {
                    txs.push_back(tx);
                }
            }
            std::lock_guard<std::mutex> lock(pendingMutex_);
            pendingReadd_.insert(pendingReadd_.begin(), txs.begin(), txs.end());
        }));
    subscriptions_.push_back(events.SubscribeNewTip([this](int32_t, const BlockHash&) {
        std::vector<TransactionRef> txs;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            txs.swap(pendingReadd_);
        }
        if (!txs.empty()) {
            ReaddForDisconnect(txs, Clock());
        }
    }));
}

Mempool::~Mempool() {
    if (chain_) {
        for (ChainEvents::SubscriptionId id : subscriptions_) {
            chain_->Events().Unsubscribe(id);
        }
    }
}

Mempool::EntryShard& Mempool::ShardFor(const TxHash& txid) const {
    return entryShards_[Hash256Hasher()(txid) % NUM_SHARDS];
}

Mempool::SpenderShard& Mempool::ShardFor(const OutPoint& outpoint) const {
    return spenderShards_[OutPointHasher()(outpoint) % NUM_SHARDS];
}

std::vector<std::unique_lock<std::mutex>> Mempool::LockStripes(
    const std::vector<OutPoint>& outpoints) const {
    std::set<size_t> indices;
    for (const OutPoint& outpoint : outpoints) {
        indices.insert(OutPointHasher()(outpoint) % NUM_STRIPES);
    }
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(indices.size());
    for (size_t index : indices) {
        locks.emplace_back(stripes_[index]);
    }
    return locks;
}

std::set<size_t> Mempool::TxidStripes(const std::set<TxHash>& txids) {
    std::set<size_t> indices;
    for (const TxHash& txid : txids) {
        indices.insert(Hash256Hasher()(txid) % NUM_STRIPES);
    }
    return indices;
}

std::vector<std::unique_lock<std::mutex>> Mempool::LockTxids(const std::set<TxHash>& txids) const {
    const std::set<size_t> indices = TxidStripes(txids);
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(indices.size());
    for (size_t index : indices) {
        locks.emplace_back(txidStripes_[index]);
    }
    return locks;
}

void Mempool::SetChainTip(int32_t height, int64_t medianTimePast) {
    tipHeight_.store(height);
    tipMedianTimePast_.store(medianTimePast);
}

void Mempool::TipContext(int32_t& spendHeight, int64_t& lockTimeCutoff) const {
    if (chain_) {
        auto snapshot = chain_->GetSnapshot();
        spendHeight = snapshot->height + 1;
        lockTimeCutoff = snapshot->medianTimePast;
        return;
    }
    spendHeight = tipHeight_.load() + 1;
    lockTimeCutoff = tipMedianTimePast_.load();
}

int64_t Mempool::Clock() const {
    return limits_.clock ? limits_.clock() : SystemNow();
}

// ============================================================================
// Submission
// ============================================================================

MempoolAcceptResult Mempool::SubmitBytes(const std::vector<uint8_t>& bytes, int64_t now) {
    TransactionRef tx;
    try {
        tx = DeserializeTransaction(bytes);
    } catch (const std::ios_base::failure& e) {
        consensus::ValidationState state;
        state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-tx-encoding", e.what());
        return MempoolAcceptResult::Invalid(TxHash(), state);
    }
    return Submit(tx, now);
}

MempoolAcceptResult Mempool::Submit(const TransactionRef& tx, int64_t now) {
    const TxHash txid = tx->GetHash();
    MempoolAcceptResult result;
    bool overCapacity = false;
    {
        std::shared_lock<std::shared_mutex> pool(poolMutex_);

        if (Exists(txid)) {
            return MempoolAcceptResult::Failure(txid, MempoolError::CONFLICT, "txn-already-in-mempool");
        }

        consensus::ValidationState state;
        if (!consensus::CheckTransaction(*tx, state)) {
            return MempoolAcceptResult::Invalid(txid, state);
        }
        if (tx->IsCoinBase()) {
            state.Invalid(ValidationError::MALFORMED_COINBASE, "coinbase");
            return MempoolAcceptResult::Invalid(txid, state);
        }

        // Inputs, and outputs so that no child of tx can enter meanwhile
        std::vector<OutPoint> prevouts;
        prevouts.reserve(tx->vin.size());
        for (const auto& txin : tx->vin) {
            prevouts.push_back(txin.prevout);
        }
        std::vector<OutPoint> guarded = prevouts;
        for (uint32_t i = 0; i < tx->vout.size(); ++i) {
            guarded.emplace_back(txid, i);
        }
        auto stripeLocks = LockStripes(guarded);

        int32_t spendHeight = 0;
        int64_t lockTimeCutoff = 0;
        TipContext(spendHeight, lockTimeCutoff);

        // In-pool parents; spending an output of one past its TTL is refused
        std::set<TxHash> poolParents;
        for (const auto& txin : tx->vin) {
            if (poolParents.count(txin.prevout.hash)) {
                continue;
            }
            std::optional<MempoolEntry> parent = GetEntry(txin.prevout.hash);
            if (!parent) {
                continue;
            }
            if (now - parent->time > limits_.ttl) {
                return MempoolAcceptResult::Failure(txid, MempoolError::EXPIRED,
                                                    "parent " + txin.prevout.hash.ToHex() + " expired");
            }
            poolParents.insert(txin.prevout.hash);
        }

        PoolCoinsView view(chainView_, *this, spendHeight);
        consensus::TxContext ctx;
        ctx.spendHeight = spendHeight;
        ctx.lockTimeCutoff = lockTimeCutoff;
        ctx.coinbaseMaturity = coinbaseMaturity_;

        Amount fee = 0;
        bool valid = false;
        try {
            valid = consensus::ValidateTransaction(*tx, view, ctx, verifier_, state, fee);
        } catch (const std::exception& e) {
            state.Error(std::string("validation failed: ") + e.what());
        }
        if (!valid) {
            LOG_DEBUG(util::LogCategory::MEMPOOL) << "Rejected " << txid.ToHex() << ": "
                                                  << state.ToString();
            return MempoolAcceptResult::Invalid(txid, state);
        }

        const size_t size = tx->GetTotalSize();
        const FeeRate rate(fee, size);
        if (rate < limits_.minFeeRate) {
            return MempoolAcceptResult::Failure(txid, MempoolError::FEE_TOO_LOW,
                                                "min relay fee not met, " + rate.ToString() +
                                                    " < " + limits_.minFeeRate.ToString());
        }

        // Lock every entry the change touches; grow the set until a second
        // look under the locks finds nothing outside it
        std::set<TxHash> lockedIds = CollectAffected(*tx);
        std::vector<std::unique_lock<std::mutex>> entryLocks;
        while (true) {
            entryLocks = LockTxids(lockedIds);
            const std::set<TxHash> affected = CollectAffected(*tx);
            const std::set<size_t> held = TxidStripes(lockedIds);
            const std::set<size_t> needed = TxidStripes(affected);
            if (std::includes(held.begin(), held.end(), needed.begin(), needed.end())) {
                break;
            }
            entryLocks.clear();
            lockedIds.insert(affected.begin(), affected.end());
        }

        if (FindLocked(txid)) {
            return MempoolAcceptResult::Failure(txid, MempoolError::CONFLICT, "txn-already-in-mempool");
        }
        for (const TxHash& parent : poolParents) {
            if (!FindLocked(parent)) {
                state.Invalid(ValidationError::MISSING_UTXO, "bad-txns-inputs-missingorspent",
                              "in-pool parent " + parent.ToHex() + " left the pool");
                return MempoolAcceptResult::Invalid(txid, state);
            }
        }

        std::set<TxHash> conflicts;
        for (const OutPoint& prevout : prevouts) {
            if (auto spender = FindSpender(prevout)) {
                conflicts.insert(*spender);
            }
        }

        std::set<TxHash> replaced;
        if (!conflicts.empty()) {
            if (!limits_.enableReplacement) {
                return MempoolAcceptResult::Failure(txid, MempoolError::CONFLICT, "txn-mempool-conflict");
            }
            for (const TxHash& conflict : conflicts) {
                replaced.insert(conflict);
                for (const TxHash& d : DescendantsLocked(conflict)) {
                    replaced.insert(d);
                }
            }
            if (replaced.size() > limits_.maxReplacements) {
                return MempoolAcceptResult::Failure(
                    txid, MempoolError::REPLACEMENT_REJECTED,
                    "too many potential replacements: " + std::to_string(replaced.size()));
            }
            for (const TxHash& parent : poolParents) {
                if (replaced.count(parent)) {
                    return MempoolAcceptResult::Failure(txid, MempoolError::REPLACEMENT_REJECTED,
                                                        "replacement-spends-conflicting-tx");
                }
            }

            Amount replacedFees = 0;
            for (const TxHash& r : replaced) {
                replacedFees += FindLocked(r)->fee;
            }
            FeeRate highest;
            for (const TxHash& c : conflicts) {
                highest = std::max(highest, FindLocked(c)->GetFeeRate());
            }
            if (fee <= replacedFees) {
                return MempoolAcceptResult::Failure(
                    txid, MempoolError::REPLACEMENT_REJECTED,
                    "insufficient fee, " + std::to_string(fee) + " <= " + std::to_string(replacedFees));
            }
            const Amount byIncrement = highest.GetFeePerK() + limits_.incrementalRelayFee.GetFeePerK();
            const Amount byPercent = highest.GetFeePerK() * (100 + limits_.minRbfIncreasePercent) / 100;
            if (rate.GetFeePerK() < std::max(byIncrement, byPercent)) {
                return MempoolAcceptResult::Failure(
                    txid, MempoolError::REPLACEMENT_REJECTED,
                    "insufficient fee rate, " + rate.ToString() + " < " +
                        FeeRate(std::max(byIncrement, byPercent)).ToString());
            }
        }

        // A newcomer that would be the first thing evicted is refused up front
        size_t replacedBytes = 0;
        for (const TxHash& r : replaced) {
            replacedBytes += FindLocked(r)->size;
        }
        const size_t bytesAfter = totalBytes_.load() - replacedBytes + size;
        const size_t countAfter = count_.load() - replaced.size() + 1;
        if (bytesAfter > limits_.maxBytes || countAfter > limits_.maxTransactions) {
            std::set<TxHash> skip = replaced;
            for (const TxHash& p : poolParents) {
                skip.insert(p);
                for (const TxHash& a : AncestorsLocked(p)) {
                    skip.insert(a);
                }
            }
            if (!HasCheaperEntry(rate, skip)) {
                return MempoolAcceptResult::Failure(txid, MempoolError::FULL, "mempool full");
            }
        }

        RemoveLocked(replaced, "replaced");
        InsertLocked(MempoolEntry(tx, fee, now, spendHeight, nextSequence_.fetch_add(1)));
        overCapacity = OverCapacity();

        result = MempoolAcceptResult::Success(txid, fee);
        result.replaced.assign(replaced.begin(), replaced.end());
    }

    if (overCapacity) {
        EvictIfOverCapacity();
        if (!Exists(txid)) {
            return MempoolAcceptResult::Failure(txid, MempoolError::FULL, "mempool full");
        }
    }

    if (!result.replaced.empty()) {
        LOG_INFO(util::LogCategory::MEMPOOL) << "Accepted " << txid.ToHex() << " replacing "
                                             << result.replaced.size() << " transaction(s)";
    } else {
        LOG_DEBUG(util::LogCategory::MEMPOOL) << "Accepted " << txid.ToHex() << " fee " << result.fee;
    }
    if (chain_) {
        chain_->Events().NotifyMempoolAccepted(txid);
    }
    return result;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t Mempool::EvictIfOverCapacity() {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);
    return EvictLocked();
}

size_t Mempool::Expire(int64_t now) {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);

    std::set<TxHash> expired;
    for (const TxHash& id : AllTxidsLocked()) {
        if (expired.count(id)) {
            continue;
        }
        if (now - FindLocked(id)->time > limits_.ttl) {
            expired.insert(id);
            for (const TxHash& d : DescendantsLocked(id)) {
                expired.insert(d);
            }
        }
    }
    RemoveLocked(expired, "expiry");
    if (!expired.empty()) {
        LOG_INFO(util::LogCategory::MEMPOOL) << "Expired " << expired.size() << " transaction(s)";
    }
    return expired.size();
}

void Mempool::RemoveForBlock(const Block& block) {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);

    std::set<TxHash> mined;
    for (const auto& tx : block.vtx) {
        if (FindLocked(tx->GetHash())) {
            mined.insert(tx->GetHash());
        }
    }
    RemoveLocked(mined, "block");

    std::set<TxHash> conflicts;
    for (const auto& tx : block.vtx) {
        if (tx->IsCoinBase()) {
            continue;
        }
        for (const auto& txin : tx->vin) {
            auto spender = FindSpender(txin.prevout);
            if (spender && *spender != tx->GetHash() && !conflicts.count(*spender)) {
                conflicts.insert(*spender);
                for (const TxHash& d : DescendantsLocked(*spender)) {
                    conflicts.insert(d);
                }
            }
        }
    }
    RemoveLocked(conflicts, "conflict");

    LOG_DEBUG(util::LogCategory::MEMPOOL) << "Block " << block.GetHash().ToHex() << ": removed "
                                          << mined.size() << " mined, " << conflicts.size()
                                          << " conflicting";
}

void Mempool::ReaddForDisconnect(const std::vector<TransactionRef>& txs, int64_t now) {
    size_t readded = 0;
    std::vector<TransactionRef> remaining = txs;
    bool progress = true;
    while (!remaining.empty() && progress) {
        progress = false;
        std::vector<TransactionRef> retry;
        for (const auto& tx : remaining) {
            MempoolAcceptResult r = Submit(tx, now);
            if (r.accepted) {
                ++readded;
                progress = true;
            } else if (r.validation == ValidationError::MISSING_UTXO) {
                retry.push_back(tx);
            } else {
                LOG_DEBUG(util::LogCategory::MEMPOOL) << "Dropped disconnected " << tx->GetHash().ToHex()
                                                      << ": " << r.ToString();
            }
        }
        remaining.swap(retry);
    }
    for (const auto& tx : remaining) {
        LOG_DEBUG(util::LogCategory::MEMPOOL) << "Dropped disconnected " << tx->GetHash().ToHex()
                                              << ": inputs missing";
    }

    std::unique_lock<std::shared_mutex> pool(poolMutex_);

    std::set<TxHash> orphaned;
    for (const TxHash& id : AllTxidsLocked()) {
        if (orphaned.count(id)) {
            continue;
        }
        for (const auto& txin : FindLocked(id)->tx->vin) {
            const MempoolEntry* parent = FindLocked(txin.prevout.hash);
            const bool inPool = parent && txin.prevout.n < parent->tx->vout.size();
            if (!inPool && !chainView_.HaveCoin(txin.prevout)) {
                orphaned.insert(id);
                for (const TxHash& d : DescendantsLocked(id)) {
                    orphaned.insert(d);
                }
                break;
            }
        }
    }
    RemoveLocked(orphaned, "inputs-vanished");

    LOG_INFO(util::LogCategory::MEMPOOL) << "Re-admitted " << readded << " of " << txs.size()
                                         << " disconnected transaction(s), purged "
                                         << orphaned.size();
}

void Mempool::Clear() {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);
    for (auto& shard : entryShards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.clear();
    }
    for (auto& shard : spenderShards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.spenders.clear();
    }
    count_.store(0);
    totalBytes_.store(0);
}

// ============================================================================
// Queries
// ============================================================================

bool Mempool::Exists(const TxHash& txid) const {
    const EntryShard& shard = ShardFor(txid);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.count(txid) > 0;
}

TransactionRef Mempool::Get(const TxHash& txid) const {
    const EntryShard& shard = ShardFor(txid);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(txid);
    return it != shard.entries.end() ? it->second.tx : nullptr;
}

std::optional<MempoolEntry> Mempool::GetEntry(const TxHash& txid) const {
    const EntryShard& shard = ShardFor(txid);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(txid);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

TransactionRef Mempool::GetSpender(const OutPoint& outpoint) const {
    std::optional<TxHash> spender = FindSpender(outpoint);
    return spender ? Get(*spender) : nullptr;
}

std::optional<FeeRate> Mempool::GetFeeRate(const TxHash& txid) const {
    const EntryShard& shard = ShardFor(txid);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(txid);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second.GetFeeRate();
}

std::optional<Coin> Mempool::GetPoolCoin(const OutPoint& outpoint, int32_t height) const {
    const EntryShard& shard = ShardFor(outpoint.hash);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(outpoint.hash);
    if (it == shard.entries.end() || outpoint.n >= it->second.tx->vout.size()) {
        return std::nullopt;
    }
    return Coin(it->second.tx->vout[outpoint.n], height, false);
}

PrioritizedView Mempool::GetPrioritizedView(size_t maxBytes) const {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);
    std::unordered_map<TxHash, PrioritizedView::Item, Hash256Hasher> items;
    for (const auto& shard : entryShards_) {
        for (const auto& entry : shard.entries) {
            const MempoolEntry& e = entry.second;
            PrioritizedView::Item item{e.tx, e.fee, e.size, e.time, e.sequence,
                                       std::vector<TxHash>(e.parents.begin(), e.parents.end()),
                                       std::vector<TxHash>(e.children.begin(), e.children.end())};
            items.emplace(entry.first, std::move(item));
        }
    }
    return PrioritizedView(std::move(items), maxBytes);
}

bool Mempool::CheckConsistency() const {
    std::unique_lock<std::shared_mutex> pool(poolMutex_);
    size_t count = 0;
    size_t bytes = 0;
    size_t spenders = 0;
    for (const auto& shard : entryShards_) {
        for (const auto& entry : shard.entries) {
            const TxHash& id = entry.first;
            const MempoolEntry& e = entry.second;
            ++count;
            bytes += e.size;
            for (const TxHash& p : e.parents) {
                const MempoolEntry* parent = FindLocked(p);
                if (!parent || !parent->children.count(id)) return false;
            }
            for (const TxHash& c : e.children) {
                const MempoolEntry* child = FindLocked(c);
                if (!child || !child->parents.count(id)) return false;
            }
            for (const auto& txin : e.tx->vin) {
                auto spender = FindSpender(txin.prevout);
                if (!spender || *spender != id) return false;
                // Every in-pool output this spends is linked
                if (FindLocked(txin.prevout.hash) && !e.parents.count(txin.prevout.hash)) return false;
            }
            uint64_t descCount = 1;
            size_t descSize = e.size;
            Amount descFees = e.fee;
            for (const TxHash& d : DescendantsLocked(id)) {
                const MempoolEntry* de = FindLocked(d);
                ++descCount;
                descSize += de->size;
                descFees += de->fee;
            }
            if (descCount != e.countWithDescendants || descSize != e.sizeWithDescendants ||
                descFees != e.feesWithDescendants) {
                return false;
            }
        }
    }
    for (const auto& shard : spenderShards_) {
        spenders += shard.spenders.size();
    }
    size_t inputs = 0;
    for (const auto& shard : entryShards_) {
        for (const auto& entry : shard.entries) {
            inputs += entry.second.tx->vin.size();
        }
    }
    return count == count_.load() && bytes == totalBytes_.load() && spenders == inputs;
}

// ============================================================================
// Graph Helpers
// ============================================================================

std::optional<TxHash> Mempool::FindSpender(const OutPoint& outpoint) const {
    const SpenderShard& shard = ShardFor(outpoint);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.spenders.find(outpoint);
    if (it == shard.spenders.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::set<TxHash> Mempool::LinkedSnapshot(const TxHash& txid, bool ancestors) const {
    std::set<TxHash> result;
    std::queue<TxHash> toProcess;
    toProcess.push(txid);
    while (!toProcess.empty()) {
        std::optional<MempoolEntry> e = GetEntry(toProcess.front());
        toProcess.pop();
        if (!e) continue;
        for (const TxHash& next : ancestors ? e->parents : e->children) {
            if (result.insert(next).second) {
                toProcess.push(next);
            }
        }
    }
    return result;
}

std::set<TxHash> Mempool::CollectAffected(const Transaction& tx) const {
    const TxHash txid = tx.GetHash();
    std::set<TxHash> affected{txid};
    auto merge = [&affected](const std::set<TxHash>& ids) { affected.insert(ids.begin(), ids.end()); };

    // Parents and their ancestors gain a descendant
    for (const auto& txin : tx.vin) {
        affected.insert(txin.prevout.hash);
        merge(LinkedSnapshot(txin.prevout.hash, true));
    }

    // Conflicts leave with their descendants; their ancestors lose them
    for (const auto& txin : tx.vin) {
        std::optional<TxHash> conflict = FindSpender(txin.prevout);
        if (!conflict) continue;
        std::set<TxHash> removed = LinkedSnapshot(*conflict, false);
        removed.insert(*conflict);
        for (const TxHash& r : removed) {
            merge(LinkedSnapshot(r, true));
        }
        merge(removed);
    }

    // Children already in the pool gain a parent
    for (uint32_t i = 0; i < tx.vout.size(); ++i) {
        std::optional<TxHash> child = FindSpender(OutPoint(txid, i));
        if (!child) continue;
        affected.insert(*child);
        merge(LinkedSnapshot(*child, false));
    }
    return affected;
}

bool Mempool::HasCheaperEntry(const FeeRate& rate, const std::set<TxHash>& skip) const {
    for (const auto& shard : entryShards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto& entry : shard.entries) {
            if (!skip.count(entry.first) && entry.second.GetDescendantScore() < rate) {
                return true;
            }
        }
    }
    return false;
}

MempoolEntry* Mempool::FindLocked(const TxHash& txid) const {
    EntryShard& shard = ShardFor(txid);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(txid);
    return it != shard.entries.end() ? &it->second : nullptr;
}

std::set<TxHash> Mempool::DescendantsLocked(const TxHash& txid) const {
    std::set<TxHash> result;
    std::queue<TxHash> toProcess;
    toProcess.push(txid);
    while (!toProcess.empty()) {
        const MempoolEntry* e = FindLocked(toProcess.front());
        toProcess.pop();
        if (!e) continue;
        for (const TxHash& child : e->children) {
            if (result.insert(child).second) {
                toProcess.push(child);
            }
        }
    }
    return result;
}

std::set<TxHash> Mempool::AncestorsLocked(const TxHash& txid) const {
    std::set<TxHash> result;
    std::queue<TxHash> toProcess;
    toProcess.push(txid);
    while (!toProcess.empty()) {
        const MempoolEntry* e = FindLocked(toProcess.front());
        toProcess.pop();
        if (!e) continue;
        for (const TxHash& parent : e->parents) {
            if (result.insert(parent).second) {
                toProcess.push(parent);
            }
        }
    }
    return result;
}

std::vector<TxHash> Mempool::AllTxidsLocked() const {
    std::vector<TxHash> ids;
    ids.reserve(count_.load());
    for (const auto& shard : entryShards_) {
        for (const auto& entry : shard.entries) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

void Mempool::InsertLocked(MempoolEntry entry) {
    const TxHash txid = entry.GetTxHash();
    for (const auto& txin : entry.tx->vin) {
        if (FindLocked(txin.prevout.hash)) {
            entry.parents.insert(txin.prevout.hash);
        }
    }
    // A transaction re-added after a disconnect can find its children here
    for (uint32_t i = 0; i < entry.tx->vout.size(); ++i) {
        if (auto child = FindSpender(OutPoint(txid, i))) {
            entry.children.insert(*child);
        }
    }

    std::set<TxHash> ancestors;
    for (const TxHash& p : entry.parents) {
        ancestors.insert(p);
        for (const TxHash& a : AncestorsLocked(p)) {
            ancestors.insert(a);
        }
    }

    // Descendants the new entry brings along
    std::set<TxHash> descendants;
    for (const TxHash& c : entry.children) {
        descendants.insert(c);
        for (const TxHash& d : DescendantsLocked(c)) {
            descendants.insert(d);
        }
    }
    for (const TxHash& d : descendants) {
        const MempoolEntry* de = FindLocked(d);
        entry.countWithDescendants += 1;
        entry.sizeWithDescendants += de->size;
        entry.feesWithDescendants += de->fee;
    }

    // Each ancestor gains the new entry plus whichever of its descendants
    // were not already below that ancestor
    struct Delta {
        uint64_t count{0};
        size_t size{0};
        Amount fees{0};
    };
    std::unordered_map<TxHash, Delta, Hash256Hasher> deltas;
    for (const TxHash& a : ancestors) {
        Delta delta{1, entry.size, entry.fee};
        if (!descendants.empty()) {
            const std::set<TxHash> existing = DescendantsLocked(a);
            for (const TxHash& d : descendants) {
                if (existing.count(d)) continue;
                const MempoolEntry* de = FindLocked(d);
                delta.count += 1;
                delta.size += de->size;
                delta.fees += de->fee;
            }
        }
        deltas.emplace(a, delta);
    }

    const size_t size = entry.size;
    const TransactionRef tx = entry.tx;
    const std::set<TxHash> parents = entry.parents;
    const std::set<TxHash> children = entry.children;
    {
        EntryShard& shard = ShardFor(txid);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.emplace(txid, std::move(entry));
    }
    for (const TxHash& p : parents) {
        EntryShard& shard = ShardFor(p);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.at(p).children.insert(txid);
    }
    for (const TxHash& c : children) {
        EntryShard& shard = ShardFor(c);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.at(c).parents.insert(txid);
    }
    for (const auto& d : deltas) {
        EntryShard& shard = ShardFor(d.first);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        MempoolEntry& anc = shard.entries.at(d.first);
        anc.countWithDescendants += d.second.count;
        anc.sizeWithDescendants += d.second.size;
        anc.feesWithDescendants += d.second.fees;
    }
    for (const auto& txin : tx->vin) {
        SpenderShard& shard = ShardFor(txin.prevout);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.spenders[txin.prevout] = txid;
    }
    count_.fetch_add(1);
    totalBytes_.fetch_add(size);
}

void Mempool::RemoveLocked(const std::set<TxHash>& txids, const char* reason) {
    if (txids.empty()) {
        return;
    }

    // Surviving ancestors lose the removed entries from their package totals
    for (const TxHash& id : txids) {
        const MempoolEntry* e = FindLocked(id);
        if (!e) continue;
        for (const TxHash& a : AncestorsLocked(id)) {
            if (txids.count(a)) continue;
            EntryShard& shard = ShardFor(a);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            MempoolEntry& anc = shard.entries.at(a);
            anc.countWithDescendants -= 1;
            anc.sizeWithDescendants -= e->size;
            anc.feesWithDescendants -= e->fee;
        }
    }

    size_t removed = 0;
    for (const TxHash& id : txids) {
        const MempoolEntry* e = FindLocked(id);
        if (!e) continue;
        const TransactionRef tx = e->tx;
        const size_t size = e->size;
        const std::set<TxHash> parents = e->parents;
        const std::set<TxHash> children = e->children;

        for (const TxHash& p : parents) {
            if (txids.count(p) || !FindLocked(p)) continue;
            EntryShard& shard = ShardFor(p);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.entries.at(p).children.erase(id);
        }
        for (const TxHash& c : children) {
            if (txids.count(c) || !FindLocked(c)) continue;
            EntryShard& shard = ShardFor(c);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.entries.at(c).parents.erase(id);
        }
        for (const auto& txin : tx->vin) {
            SpenderShard& shard = ShardFor(txin.prevout);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            auto it = shard.spenders.find(txin.prevout);
            if (it != shard.spenders.end() && it->second == id) {
                shard.spenders.erase(it);
            }
        }
        {
            EntryShard& shard = ShardFor(id);
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.entries.erase(id);
        }
        count_.fetch_sub(1);
        totalBytes_.fetch_sub(size);
        ++removed;
    }
    LOG_DEBUG(util::LogCategory::MEMPOOL) << "Removed " << removed << " transaction(s): " << reason;
}

bool Mempool::OverCapacity() const {
    return count_.load() > 0 &&
           (totalBytes_.load() > limits_.maxBytes || count_.load() > limits_.maxTransactions);
}

size_t Mempool::EvictLocked() {
    size_t removed = 0;
    while (OverCapacity()) {
        const MempoolEntry* victim = nullptr;
        for (const auto& shard : entryShards_) {
            for (const auto& entry : shard.entries) {
                const MempoolEntry& e = entry.second;
                if (!victim) {
                    victim = &e;
                    continue;
                }
                const FeeRate score = e.GetDescendantScore();
                const FeeRate victimScore = victim->GetDescendantScore();
                if (score < victimScore || (score == victimScore && e.sequence > victim->sequence)) {
                    victim = &e;
                }
            }
        }
        std::set<TxHash> package = DescendantsLocked(victim->GetTxHash());
        package.insert(victim->GetTxHash());
        LOG_DEBUG(util::LogCategory::MEMPOOL) << "Evicting " << victim->GetTxHash().ToHex()
                                              << " score " << victim->GetDescendantScore().ToString()
                                              << " with " << package.size() - 1 << " descendant(s)";
        removed += package.size();
        RemoveLocked(package, "sizelimit");
    }
    return removed;
}

} // namespace strata
