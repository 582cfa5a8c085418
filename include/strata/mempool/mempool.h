// STRATA - Mempool Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the transaction memory pool.
// The mempool holds unconfirmed transactions waiting to be included in blocks.

#ifndef STRATA_MEMPOOL_MEMPOOL_H
#define STRATA_MEMPOOL_MEMPOOL_H

#include "strata/chain/coins.h"
#include "strata/chain/events.h"
#include "strata/consensus/validation.h"
#include "strata/core/block.h"
#include "strata/core/errors.h"
#include "strata/core/transaction.h"
#include "strata/core/types.h"
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace strata {

class ChainStateManager;

// ============================================================================
// Fee Rate - Fee per 1000 bytes
// ============================================================================

class FeeRate {
private:
    Amount nSatoshisPerK;

public:
    FeeRate() : nSatoshisPerK(0) {}

    explicit FeeRate(Amount satoshisPerK) : nSatoshisPerK(satoshisPerK) {}

    FeeRate(Amount fee, size_t bytes) {
        nSatoshisPerK = bytes > 0 ? (fee * 1000) / static_cast<Amount>(bytes) : 0;
    }

    /// Fee for bytes at this rate, rounded up
    Amount GetFee(size_t bytes) const {
        const Amount scaled = nSatoshisPerK * static_cast<Amount>(bytes);
        return scaled / 1000 + (scaled % 1000 > 0 ? 1 : 0);
    }

    Amount GetFeePerK() const { return nSatoshisPerK; }

    bool operator<(const FeeRate& other) const { return nSatoshisPerK < other.nSatoshisPerK; }
    bool operator>(const FeeRate& other) const { return nSatoshisPerK > other.nSatoshisPerK; }
    bool operator<=(const FeeRate& other) const { return nSatoshisPerK <= other.nSatoshisPerK; }
    bool operator>=(const FeeRate& other) const { return nSatoshisPerK >= other.nSatoshisPerK; }
    bool operator==(const FeeRate& other) const { return nSatoshisPerK == other.nSatoshisPerK; }
    bool operator!=(const FeeRate& other) const { return nSatoshisPerK != other.nSatoshisPerK; }

    std::string ToString() const;
};

// ============================================================================
// Mempool Entry
// ============================================================================

/**
 * A transaction in the pool plus the data used to rank it. Dependencies are
 * txid sets, never pointers; entries are owned by the pool's map.
 */
struct MempoolEntry {
    TransactionRef tx;
    Amount fee{0};
    size_t size{0};
    int64_t time{0};
    int32_t entryHeight{0};
    /// Insertion order. A parent re-added after a disconnect can carry a
    /// higher value than children already in the pool
    uint64_t sequence{0};

    /// In-pool transactions whose outputs this one spends
    std::set<TxHash> parents;
    /// In-pool transactions spending this one's outputs
    std::set<TxHash> children;

    // Totals over this entry and all in-pool descendants
    uint64_t countWithDescendants{1};
    uint64_t sizeWithDescendants{0};
    Amount feesWithDescendants{0};

    MempoolEntry() = default;
    MempoolEntry(const TransactionRef& txIn, Amount feeIn, int64_t timeIn, int32_t heightIn,
                 uint64_t sequenceIn);

    const TxHash& GetTxHash() const { return tx->GetHash(); }
    FeeRate GetFeeRate() const { return FeeRate(fee, size); }

    /// max(own rate, rate of the package with all descendants)
    FeeRate GetDescendantScore() const {
        return std::max(GetFeeRate(), FeeRate(feesWithDescendants, sizeWithDescendants));
    }
};

// ============================================================================
// Mempool Limits
// ============================================================================

struct MempoolLimits {
    /// Maximum total serialized size of all entries
    size_t maxBytes = 300 * 1000 * 1000;

    /// Maximum number of entries
    size_t maxTransactions = 100000;

    /// Entries older than this many seconds expire
    int64_t ttl = 14 * 24 * 60 * 60;

    /// Minimum fee rate to enter the pool
    FeeRate minFeeRate{1000};

    /// A replacement must beat the rate it replaces by at least this much
    FeeRate incrementalRelayFee{1000};

    bool enableReplacement = true;

    /// A replacement's rate must also be this many percent above the replaced rate
    int64_t minRbfIncreasePercent = 10;

    /// Most entries (conflicts plus their descendants) one replacement may evict
    size_t maxReplacements = 100;

    /// Seconds since the epoch for event-driven resubmission; defaults to the system clock
    std::function<int64_t()> clock;
};

// ============================================================================
// Accept Result
// ============================================================================

struct MempoolAcceptResult {
    bool accepted{false};
    TxHash txid;
    Amount fee{0};

    MempoolError error{MempoolError::NONE};
    ValidationError validation{ValidationError::NONE};
    std::string rejectReason;

    /// Entries removed by a replacement
    std::vector<TxHash> replaced;

    static MempoolAcceptResult Success(const TxHash& id, Amount f) {
        MempoolAcceptResult r;
        r.accepted = true;
        r.txid = id;
        r.fee = f;
        return r;
    }

    static MempoolAcceptResult Failure(const TxHash& id, MempoolError err, std::string reason) {
        MempoolAcceptResult r;
        r.txid = id;
        r.error = err;
        r.rejectReason = std::move(reason);
        return r;
    }

    static MempoolAcceptResult Invalid(const TxHash& id, const consensus::ValidationState& state) {
        MempoolAcceptResult r;
        r.txid = id;
        r.validation = state.GetError();
        r.rejectReason = state.GetRejectReason();
        return r;
    }

    bool IsValid() const { return accepted; }
    std::string ToString() const;
};

// ============================================================================
// PrioritizedView - Block template ordering
// ============================================================================

/**
 * Lazy walk over a snapshot of the pool in block-template order.
 *
 * Each step picks the transaction whose package (itself plus ancestors not
 * yet yielded) pays the highest rate, earliest arrival first on ties, and
 * yields the package parents first. A package that does not fit in the
 * remaining byte budget is skipped along with everything descending from
 * it. The snapshot does not follow later pool changes; take a new view to
 * start over.
 */
class PrioritizedView {
public:
    /// Next transaction, or null when nothing else fits
    TransactionRef Next();

    size_t BytesUsed() const { return used_; }
    size_t MaxBytes() const { return maxBytes_; }

private:
    friend class Mempool;

    struct Item {
        TransactionRef tx;
        Amount fee;
        size_t size;
        int64_t time;
        uint64_t sequence;
        std::vector<TxHash> parents;
        std::vector<TxHash> children;
    };

    PrioritizedView(std::unordered_map<TxHash, Item, Hash256Hasher> items, size_t maxBytes);

    /// Unyielded in-view ancestors of txid, not including txid
    std::set<TxHash> PendingAncestors(const TxHash& txid) const;
    void Exclude(const TxHash& txid);

    std::unordered_map<TxHash, Item, Hash256Hasher> items_;
    std::unordered_set<TxHash, Hash256Hasher> done_;
    std::vector<TransactionRef> queue_;
    size_t queuePos_{0};
    size_t maxBytes_;
    size_t used_{0};
};

// ============================================================================
// Mempool
// ============================================================================

/**
 * Concurrent pool of unconfirmed transactions.
 *
 * Entries and spenders live in sharded maps; lookups take one shard's
 * shared lock. Submissions run in parallel under the pool lock in shared
 * mode. A submitter holds the outpoint locks of everything its transaction
 * spends or creates, then the txid locks of every entry whose links or
 * totals the submission changes, and runs conflict check, replacement and
 * insertion as one step under them. Block handlers, expiry, eviction and
 * snapshots take the pool lock exclusively.
 */
class Mempool {
public:
    static constexpr size_t NUM_SHARDS = 16;
    static constexpr size_t NUM_STRIPES = 64;

    /**
     * @param chainView Confirmed coins; must outlive the pool
     * @param chain If set, supplies the tip context and the event bus; the
     *              pool removes mined transactions and re-admits
     *              disconnected ones on its own
     */
    Mempool(const CoinsView& chainView, const consensus::SignatureVerifier& verifier,
            MempoolLimits limits = MempoolLimits(), ChainStateManager* chain = nullptr,
            int coinbaseMaturity = 100);
    ~Mempool();

    Mempool(const Mempool&) = delete;
    Mempool& operator=(const Mempool&) = delete;

    // ========================================================================
    // Adding Transactions
    // ========================================================================

    /**
     * Validate tx against the confirmed coins plus in-pool outputs and add
     * it, replacing conflicting entries when the replacement rules allow.
     */
    MempoolAcceptResult Submit(const TransactionRef& tx, int64_t now);

    /// Decode then Submit; undecodable bytes are MALFORMED_TRANSACTION
    MempoolAcceptResult SubmitBytes(const std::vector<uint8_t>& bytes, int64_t now);

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Evict lowest descendant score packages until within limits; returns entries removed
    size_t EvictIfOverCapacity();

    /// Remove entries older than the TTL with their descendants
    size_t Expire(int64_t now);

    /// Drop transactions mined by block and everything conflicting with them
    void RemoveForBlock(const Block& block);

    /**
     * Resubmit transactions of disconnected blocks, then drop entries whose
     * inputs vanished. A transaction missing an input is retried after the
     * others, so txs need not be in dependency order.
     */
    void ReaddForDisconnect(const std::vector<TransactionRef>& txs, int64_t now);

    void Clear();

    /// Used when no chain manager is attached
    void SetChainTip(int32_t height, int64_t medianTimePast);

    // ========================================================================
    // Queries
    // ========================================================================

    bool Exists(const TxHash& txid) const;
    TransactionRef Get(const TxHash& txid) const;
    std::optional<MempoolEntry> GetEntry(const TxHash& txid) const;

    /// In-pool transaction spending outpoint, or null
    TransactionRef GetSpender(const OutPoint& outpoint) const;

    std::optional<FeeRate> GetFeeRate(const TxHash& txid) const;

    size_t Size() const { return count_.load(); }
    size_t TotalBytes() const { return totalBytes_.load(); }

    PrioritizedView GetPrioritizedView(size_t maxBytes) const;

    const MempoolLimits& GetLimits() const { return limits_; }

    /// Links and totals agree with the entries; for tests
    bool CheckConsistency() const;

    /// Output of an in-pool transaction, whether or not something spends it
    std::optional<Coin> GetPoolCoin(const OutPoint& outpoint, int32_t height) const;

private:
    using EntryMap = std::unordered_map<TxHash, MempoolEntry, Hash256Hasher>;
    using SpenderMap = std::unordered_map<OutPoint, TxHash, OutPointHasher>;

    struct EntryShard {
        mutable std::shared_mutex mutex;
        EntryMap entries;
    };

    struct SpenderShard {
        mutable std::shared_mutex mutex;
        SpenderMap spenders;
    };

    EntryShard& ShardFor(const TxHash& txid) const;
    SpenderShard& ShardFor(const OutPoint& outpoint) const;

    /// Lock the stripes covering outpoints in index order
    std::vector<std::unique_lock<std::mutex>> LockStripes(const std::vector<OutPoint>& outpoints) const;

    static std::set<size_t> TxidStripes(const std::set<TxHash>& txids);

    /// Lock the txid stripes covering txids in index order
    std::vector<std::unique_lock<std::mutex>> LockTxids(const std::set<TxHash>& txids) const;

    /// In-pool transaction spending outpoint
    std::optional<TxHash> FindSpender(const OutPoint& outpoint) const;

    /// Ancestors (or descendants) of txid read from entry copies; safe without txid locks
    std::set<TxHash> LinkedSnapshot(const TxHash& txid, bool ancestors) const;

    /// Every entry whose links or totals change when tx replaces its
    /// conflicts and enters the pool, plus tx and its input txids
    std::set<TxHash> CollectAffected(const Transaction& tx) const;

    /// Some entry outside skip ranks below rate for eviction
    bool HasCheaperEntry(const FeeRate& rate, const std::set<TxHash>& skip) const;

    // The *Locked helpers require the txid locks of every entry they touch,
    // or the pool lock exclusively

    MempoolEntry* FindLocked(const TxHash& txid) const;
    std::set<TxHash> DescendantsLocked(const TxHash& txid) const;
    std::set<TxHash> AncestorsLocked(const TxHash& txid) const;
    void InsertLocked(MempoolEntry entry);
    void RemoveLocked(const std::set<TxHash>& txids, const char* reason);
    size_t EvictLocked();
    std::vector<TxHash> AllTxidsLocked() const;

    bool OverCapacity() const;

    /// Spend height and lock-time cutoff of the next block
    void TipContext(int32_t& spendHeight, int64_t& lockTimeCutoff) const;

    int64_t Clock() const;

    const CoinsView& chainView_;
    const consensus::SignatureVerifier& verifier_;
    const MempoolLimits limits_;
    ChainStateManager* chain_;
    const int coinbaseMaturity_;

    /// Shared by submitters; exclusive for block handlers, expiry, eviction
    mutable std::shared_mutex poolMutex_;
    /// Outpoint locks: held while a submission is validated and applied
    mutable std::array<std::mutex, NUM_STRIPES> stripes_;
    /// Per-txid locks guarding an entry's links and totals
    mutable std::array<std::mutex, NUM_STRIPES> txidStripes_;

    mutable std::array<EntryShard, NUM_SHARDS> entryShards_;
    mutable std::array<SpenderShard, NUM_SHARDS> spenderShards_;

    std::atomic<size_t> count_{0};
    std::atomic<size_t> totalBytes_{0};
    std::atomic<uint64_t> nextSequence_{0};

    std::atomic<int32_t> tipHeight_{0};
    std::atomic<int64_t> tipMedianTimePast_{0};

    /// Transactions of disconnected blocks awaiting the new tip, in block order
    std::mutex pendingMutex_;
    std::vector<TransactionRef> pendingReadd_;

    std::vector<ChainEvents::SubscriptionId> subscriptions_;
};

} // namespace strata

#endif // STRATA_MEMPOOL_MEMPOOL_H
