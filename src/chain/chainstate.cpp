// STRATA - Chain State Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/chainstate.h"
#include "strata/util/logging.h"
#include "strata/util/threadpool.h"
#include <algorithm>
#include <chrono>
#include <deque>
#include <ios>
#include <unordered_map>

namespace strata {

std::string ChainResult::ToString() const {
    if (duplicate) {
        return "duplicate " + hash.ToHex();
    }
    if (accepted) {
        return "accepted " + hash.ToHex() + " at height " + std::to_string(height) +
               (tipChanged ? " (new tip)" : " (stored)");
    }
    if (validation != ValidationError::NONE) {
        return strata::ToString(validation) + ": " + message;
    }
    if (chain != ChainError::NONE) {
        return strata::ToString(chain) + ": " + message;
    }
    if (storage != StorageError::NONE) {
        return strata::ToString(storage) + ": " + message;
    }
    return "rejected: " + message;
}

// ============================================================================
// Construction & Initialization
// ============================================================================

ChainStateManager::ChainStateManager(const consensus::Params& params,
                                     UtxoSet& utxo,
                                     db::BlockStore& blocks,
                                     const consensus::SignatureVerifier& verifier,
                                     util::ThreadPool* pool,
                                     ChainConfig config)
    : m_params(params),
      m_utxo(utxo),
      m_blocks(blocks),
      m_verifier(verifier),
      m_pool(pool),
      m_config(std::move(config)),
      m_orphans(m_config.maxOrphans),
      m_difficulty(consensus::DifficultyParams::FromConsensus(params)),
      m_snapshot(std::make_shared<const ChainSnapshot>()) {
    m_checkpoints.LoadFromParams(m_params);
    m_checkpoints.SetRollingDepth(m_config.checkpointInterval);
}

ChainResult ChainStateManager::Initialize(const Block& genesis) {
    std::vector<PendingEvent> events;
    ChainResult result;
    {
        std::lock_guard<std::recursive_mutex> lock(m_cs);
        const BlockHash hash = genesis.GetHash();

        if (m_chain.Tip()) {
            return ChainResult::Rejected(hash, ChainError::NONE, "chain already initialized");
        }
        if (!m_params.hashGenesisBlock.IsNull() && hash != m_params.hashGenesisBlock) {
            consensus::ValidationState state;
            state.Invalid(ValidationError::INVALID_PROOF_OF_WORK, "bad-genesis",
                          "genesis hash does not match the network");
            return ChainResult::Invalid(hash, state);
        }

        consensus::ValidationState state;
        if (!consensus::CheckBlock(genesis, state, m_params, false)) {
            return ChainResult::Invalid(hash, state);
        }

        db::Status status;
        BlockIndex* pindex = AddToBlockIndex(genesis, nullptr, status);
        if (!pindex) {
            return ChainResult::Storage(hash, db::ToStorageError(status), status.ToString());
        }

        StepResult step = ConnectTip(pindex, genesis, events);
        if (!step.ok) {
            return step.failure;
        }
        ++m_generation;
        UpdateTip(pindex);
        result = ChainResult::Accepted(hash, 0, true);
        LOG_INFO(util::LogCategory::CHAIN) << "Chain initialized at genesis " << hash.ToHex();
    }
    FireEvents(events);
    m_events.NotifyNewTip(0, result.hash);
    return result;
}

bool ChainStateManager::LoadFromStore() {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    STRATA_LOG_TIMER(util::LogCategory::CHAIN, "LoadFromStore");

    std::optional<BlockHash> best = m_blocks.ReadBestChain();
    if (!best) {
        LOG_INFO(util::LogCategory::CHAIN) << "No stored chain";
        return false;
    }

    m_blockIndex.clear();
    std::unordered_map<BlockHash, BlockHash, Hash256Hasher> prevs;
    db::Status s = m_blocks.ForEachIndex([&](const BlockHash& hash, const DiskBlockIndex& disk) {
        auto pindex = std::make_unique<BlockIndex>(disk.header);
        pindex->nHeight = disk.nHeight;
        pindex->nStatus = static_cast<BlockStatus>(disk.nStatus);
        pindex->nTx = disk.nTx;
        pindex->nSequenceId = disk.nSequenceId;
        auto inserted = m_blockIndex.emplace(hash, std::move(pindex));
        inserted.first->second->phashBlock = &inserted.first->first;
        prevs.emplace(hash, disk.header.hashPrevBlock);
        m_nextSequenceId = std::max(m_nextSequenceId, disk.nSequenceId + 1);
    });
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::CHAIN) << "Cannot read block index: " << s.ToString();
        m_blockIndex.clear();
        return false;
    }

    // Link parents and recompute work in height order
    std::vector<BlockIndex*> byHeight;
    byHeight.reserve(m_blockIndex.size());
    for (auto& entry : m_blockIndex) {
        byHeight.push_back(entry.second.get());
    }
    std::sort(byHeight.begin(), byHeight.end(), [](const BlockIndex* a, const BlockIndex* b) {
        return a->nHeight < b->nHeight;
    });

    for (BlockIndex* pindex : byHeight) {
        const BlockHash& prev = prevs.at(pindex->GetBlockHash());
        if (!prev.IsNull()) {
            pindex->pprev = LookupBlockIndex(prev);
            if (!pindex->pprev || pindex->pprev->nHeight + 1 != pindex->nHeight) {
                LOG_ERROR(util::LogCategory::CHAIN) << "Stored block " << pindex->GetBlockHash().ToHex()
                                                    << " has no consistent stored parent";
                m_blockIndex.clear();
                return false;
            }
        }
        pindex->nChainWork = (pindex->pprev ? pindex->pprev->nChainWork : ArithUint256(0)) +
                             GetBlockProof(pindex->nBits);
        pindex->BuildSkip();
    }

    BlockIndex* tip = LookupBlockIndex(*best);
    if (!tip) {
        LOG_ERROR(util::LogCategory::CHAIN) << "Best chain marker " << best->ToHex()
                                            << " is not in the block index";
        m_blockIndex.clear();
        return false;
    }
    if (m_utxo.GetBestBlock() != *best) {
        LOG_ERROR(util::LogCategory::CHAIN) << "Coin set is at " << m_utxo.GetBestBlock().ToHex()
                                            << " but the chain tip is " << best->ToHex();
        m_blockIndex.clear();
        return false;
    }

    m_chain.SetTip(tip);
    UpdateTip(tip);
    LOG_INFO(util::LogCategory::CHAIN) << "Loaded " << m_blockIndex.size() << " block index entries, tip "
                                       << tip->ToString();
    return true;
}

// ============================================================================
// Block Processing
// ============================================================================

ChainResult ChainStateManager::ProcessBlockBytes(const std::vector<uint8_t>& bytes) {
    Block block;
    try {
        block = DeserializeBlock(bytes);
    } catch (const std::ios_base::failure& e) {
        consensus::ValidationState state;
        state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-blk-encoding", e.what());
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Undecodable block: " << e.what();
        return ChainResult::Invalid(BlockHash(), state);
    }
    return ProcessBlock(block);
}

ChainResult ChainStateManager::ProcessBlock(const Block& block) {
    const BlockHash hash = block.GetHash();
    if (m_halted.load()) {
        return ChainResult::Rejected(hash, ChainError::UNDO_CORRUPTION, "chain state halted");
    }

    // Context-free checks need no lock
    const uint64_t startGeneration = GetGeneration();
    consensus::ValidationState state;
    if (!consensus::CheckBlock(block, state, m_params)) {
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Block " << hash.ToHex() << " rejected: "
                                                 << state.ToString();
        return ChainResult::Invalid(hash, state);
    }

    std::vector<PendingEvent> events;
    ChainResult result;
    int32_t newHeight = -1;
    BlockHash newTip;
    bool tipMoved = false;
    {
        std::lock_guard<std::recursive_mutex> lock(m_cs);
        if (m_halted.load()) {
            return ChainResult::Rejected(hash, ChainError::UNDO_CORRUPTION, "chain state halted");
        }

        const uint64_t generationBefore = m_generation;
        const int32_t heightBefore = m_chain.Height();
        result = ProcessBlockLocked(block, startGeneration, events);
        if (result.accepted && !result.duplicate) {
            ProcessOrphans(hash, events);
        }
        if (m_generation != generationBefore && m_chain.Tip()) {
            tipMoved = true;
            newHeight = m_chain.Height();
            newTip = m_chain.Tip()->GetBlockHash();
            UpdateCommitment(heightBefore, newHeight);
        }
    }

    FireEvents(events);
    if (tipMoved) {
        m_events.NotifyNewTip(newHeight, newTip);
    }
    return result;
}

ChainResult ChainStateManager::ProcessBlockLocked(const Block& block, uint64_t startGeneration,
                                                  std::vector<PendingEvent>& events) {
    const BlockHash hash = block.GetHash();

    if (BlockIndex* known = LookupBlockIndex(hash)) {
        if (known->IsFailed()) {
            return ChainResult::Rejected(hash, ChainError::NONE, "duplicate-invalid");
        }
        return ChainResult::Duplicate(hash);
    }
    if (m_orphans.Contains(hash)) {
        return ChainResult::Duplicate(hash);
    }

    BlockIndex* parent = LookupBlockIndex(block.hashPrevBlock);
    if (!parent) {
        m_orphans.Add(block);
        LOG_DEBUG(util::LogCategory::CHAIN) << "Orphan block " << hash.ToHex() << " (parent "
                                            << block.hashPrevBlock.ToHex() << "), "
                                            << m_orphans.Size() << " held";
        return ChainResult::Rejected(hash, ChainError::UNKNOWN_ANCESTOR,
                                     "parent " + block.hashPrevBlock.ToHex() + " unknown");
    }
    if (parent->IsFailed()) {
        LOG_DEBUG(util::LogCategory::CHAIN) << "Block " << hash.ToHex() << " builds on invalid "
                                            << parent->GetBlockHash().ToHex();
        return ChainResult::Rejected(hash, ChainError::NONE, "bad-prevblk");
    }

    // Contextual header checks against the parent
    consensus::ParentContext context;
    context.height = parent->nHeight;
    context.medianTimePast = parent->GetMedianTimePast();
    context.requiredBits = NextWorkRequired(parent);

    consensus::ValidationState state;
    if (!consensus::ContextualCheckBlockHeader(block, context, m_params, Now(), state)) {
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Block " << hash.ToHex() << " rejected: "
                                                 << state.ToString();
        return ChainResult::Invalid(hash, state);
    }

    const int32_t height = parent->nHeight + 1;
    if (m_checkpoints.ValidateBlock(height, hash) != consensus::CheckpointResult::VALID) {
        LOG_WARN(util::LogCategory::CHAIN) << "Block " << hash.ToHex() << " at height " << height
                                           << " conflicts with a checkpoint";
        return ChainResult::Rejected(hash, ChainError::REORG_TOO_DEEP, "checkpoint-mismatch");
    }

    db::Status status;
    BlockIndex* pindex = AddToBlockIndex(block, parent, status);
    if (!pindex) {
        if (status.IsCorruption()) {
            return Halt(hash, "block store corruption: " + status.ToString());
        }
        return ChainResult::Storage(hash, db::ToStorageError(status), status.ToString());
    }

    BlockIndex* tip = m_chain.Tip();

    // Extend
    if (parent == tip) {
        StepResult step = ConnectTip(pindex, block, events);
        if (!step.ok) {
            if (step.failure.validation != ValidationError::NONE) {
                InvalidateBlock(pindex);
            }
            return step.failure;
        }
        ++m_generation;
        UpdateTip(pindex);
        return ChainResult::Accepted(hash, height, true);
    }

    if (m_generation != startGeneration) {
        LOG_DEBUG(util::LogCategory::CHAIN) << "Tip moved while " << hash.ToHex()
                                            << " was checked; comparing against current tip";
    }

    // Fork evaluation: ties keep the first-seen tip
    if (tip && pindex->nChainWork <= tip->nChainWork) {
        LOG_INFO(util::LogCategory::CHAIN) << "Stored side-branch block " << hash.ToHex()
                                           << " at height " << height;
        return ChainResult::Accepted(hash, height, false);
    }

    const BlockIndex* fork = LastCommonAncestor(pindex, tip);
    if (tip && fork && fork != tip && !m_checkpoints.CanReorgAtHeight(fork->nHeight + 1)) {
        LOG_WARN(util::LogCategory::CHAIN) << "Refusing reorganization to " << hash.ToHex()
                                           << ": fork at height " << fork->nHeight
                                           << " is below checkpoint height "
                                           << m_checkpoints.GetReorgProtectionHeight();
        return ChainResult::Rejected(hash, ChainError::REORG_TOO_DEEP,
                                     "fork at height " + std::to_string(fork->nHeight) +
                                         " crosses a checkpoint");
    }

    return Reorganize(pindex, block, fork, events);
}

void ChainStateManager::ProcessOrphans(const BlockHash& hash, std::vector<PendingEvent>& events) {
    std::deque<BlockHash> parents{hash};
    while (!parents.empty()) {
        const BlockHash parent = parents.front();
        parents.pop_front();
        for (const Block& orphan : m_orphans.TakeChildren(parent)) {
            if (m_halted.load()) {
                return;
            }
            ChainResult r = ProcessBlockLocked(orphan, m_generation, events);
            LOG_DEBUG(util::LogCategory::CHAIN) << "Orphan " << r.hash.ToHex() << ": " << r.ToString();
            if (r.accepted && !r.duplicate) {
                parents.push_back(r.hash);
            }
        }
    }
}

// ============================================================================
// Block Index
// ============================================================================

BlockIndex* ChainStateManager::LookupBlockIndex(const BlockHash& hash) const {
    auto it = m_blockIndex.find(hash);
    return it != m_blockIndex.end() ? it->second.get() : nullptr;
}

BlockIndex* ChainStateManager::AddToBlockIndex(const Block& block, BlockIndex* parent,
                                               db::Status& status) {
    const BlockHash hash = block.GetHash();

    status = m_blocks.WriteBlock(block);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot store block " << hash.ToHex() << ": "
                                         << status.ToString();
        return nullptr;
    }

    auto pindex = std::make_unique<BlockIndex>(block.GetBlockHeader());
    pindex->pprev = parent;
    pindex->nHeight = parent ? parent->nHeight + 1 : 0;
    pindex->nChainWork = (parent ? parent->nChainWork : ArithUint256(0)) + GetBlockProof(block.nBits);
    pindex->nTx = static_cast<unsigned int>(block.vtx.size());
    pindex->nSequenceId = m_nextSequenceId++;
    pindex->nStatus = BlockStatus::VALID_TRANSACTIONS | BlockStatus::HAVE_DATA;

    auto inserted = m_blockIndex.emplace(hash, std::move(pindex));
    BlockIndex* pindexNew = inserted.first->second.get();
    pindexNew->phashBlock = &inserted.first->first;
    pindexNew->BuildSkip();

    status = m_blocks.WriteIndex(hash, DiskBlockIndex(*pindexNew));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot store index entry for " << hash.ToHex() << ": "
                                         << status.ToString();
        m_blockIndex.erase(inserted.first);
        return nullptr;
    }
    return pindexNew;
}

void ChainStateManager::PersistIndex(const BlockIndex* pindex) {
    db::Status s = m_blocks.WriteIndex(pindex->GetBlockHash(), DiskBlockIndex(*pindex));
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot update index entry for "
                                         << pindex->GetBlockHash().ToHex() << ": " << s.ToString();
    }
}

void ChainStateManager::InvalidateBlock(BlockIndex* pindex) {
    pindex->nStatus |= BlockStatus::FAILED_VALID;
    PersistIndex(pindex);
    for (auto& entry : m_blockIndex) {
        BlockIndex* other = entry.second.get();
        if (other != pindex && other->nHeight > pindex->nHeight &&
            other->GetAncestor(pindex->nHeight) == pindex) {
            other->nStatus |= BlockStatus::FAILED_CHILD;
            PersistIndex(other);
        }
    }
    LOG_WARN(util::LogCategory::CHAIN) << "Marked invalid: " << pindex->ToString();
}

// ============================================================================
// Connect / Disconnect
// ============================================================================

ChainStateManager::StepResult ChainStateManager::ConnectTip(BlockIndex* pindex, const Block& block,
                                                            std::vector<PendingEvent>& events) {
    StepResult step;
    const BlockHash hash = pindex->GetBlockHash();
    const int32_t height = pindex->nHeight;

    if (pindex->pprev) {
        STRATA_LOG_TIMER(util::LogCategory::BENCH, "ConnectBlockTransactions");
        Amount fees = 0;
        const int64_t cutoff = pindex->pprev->GetMedianTimePast();
        if (!consensus::ConnectBlockTransactions(block, height, cutoff, m_utxo, m_verifier, m_params,
                                                 m_pool, m_config.parallelThreshold, step.state,
                                                 fees)) {
            step.ok = false;
            const StorageError storage = step.state.GetStorageError();
            if (storage == StorageError::CORRUPTION) {
                step.fatal = true;
                step.failure = Halt(hash, "coin store corruption: " + step.state.GetRejectReason());
                return step;
            }
            if (storage != StorageError::NONE) {
                LOG_ERROR(util::LogCategory::UTXO) << "Block " << hash.ToHex() << " not connected: "
                                                   << step.state.GetRejectReason();
                step.failure = ChainResult::Storage(hash, storage, step.state.GetRejectReason());
                return step;
            }
            LOG_WARN(util::LogCategory::VALIDATION) << "Block " << hash.ToHex() << " at height "
                                                    << height << " failed: " << step.state.ToString();
            step.failure = ChainResult::Invalid(hash, step.state);
            return step;
        }
    }

    UndoRecord undo;
    UtxoStatus applied = m_utxo.ApplyBlock(block, height, undo);
    if (!applied.ok()) {
        step.ok = false;
        if (applied.IsFatal()) {
            step.fatal = true;
            step.failure = Halt(hash, applied.ToString());
        } else if (applied.validation != ValidationError::NONE) {
            step.state.Invalid(applied.validation, "bad-txns-inputs-missingorspent", applied.message);
            step.failure = ChainResult::Invalid(hash, step.state);
        } else {
            step.failure = ChainResult::Storage(hash, applied.storage, applied.message);
        }
        return step;
    }

    pindex->RaiseValidity(BlockStatus::VALID_CHAIN);
    pindex->nStatus |= BlockStatus::HAVE_UNDO;
    PersistIndex(pindex);

    m_chain.SetTip(pindex);
    db::Status s = m_blocks.WriteBestChain(hash);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot record best chain " << hash.ToHex() << ": "
                                         << s.ToString();
    }

    events.push_back(PendingEvent{PendingEvent::Kind::CONNECTED, block, hash, height});
    LOG_DEBUG(util::LogCategory::CHAIN) << "Connected " << pindex->ToString();
    return step;
}

ChainStateManager::StepResult ChainStateManager::DisconnectTip(
    std::vector<PendingEvent>& events, std::vector<TransactionRef>& disconnectedTxs) {
    StepResult step;
    BlockIndex* tip = m_chain.Tip();
    const BlockHash hash = tip->GetBlockHash();

    Block block;
    db::Status s = m_blocks.ReadBlock(hash, block);
    if (!s.ok()) {
        step.ok = false;
        step.fatal = true;
        step.failure = Halt(hash, "cannot read block to disconnect: " + s.ToString());
        return step;
    }

    UndoRecord undo;
    UtxoStatus read = m_utxo.ReadUndo(hash, undo);
    if (!read.ok()) {
        step.ok = false;
        step.fatal = true;
        step.failure = Halt(hash, "cannot read undo data: " + read.ToString());
        return step;
    }

    UtxoStatus undone = m_utxo.UndoBlock(undo);
    if (!undone.ok()) {
        step.ok = false;
        step.fatal = true;
        step.failure = Halt(hash, undone.ToString());
        return step;
    }

    tip->nStatus = tip->nStatus & ~BlockStatus::HAVE_UNDO;
    PersistIndex(tip);

    m_chain.SetTip(tip->pprev);
    if (tip->pprev) {
        s = m_blocks.WriteBestChain(tip->pprev->GetBlockHash());
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot record best chain: " << s.ToString();
        }
    }

    // Blocks leave tip first; keep the collected transactions in block order
    std::vector<TransactionRef> txs;
    for (const auto& tx : block.vtx) {
        if (!tx->IsCoinBase()) {
            txs.push_back(tx);
        }
    }
    disconnectedTxs.insert(disconnectedTxs.begin(), txs.begin(), txs.end());
    events.push_back(PendingEvent{PendingEvent::Kind::DISCONNECTED, block, hash, tip->nHeight});
    LOG_DEBUG(util::LogCategory::CHAIN) << "Disconnected " << tip->ToString();
    return step;
}

ChainResult ChainStateManager::Reorganize(BlockIndex* candidate, const Block& candidateBlock,
                                          const BlockIndex* fork, std::vector<PendingEvent>& events) {
    STRATA_LOG_TIMER(util::LogCategory::BENCH, "Reorganize");
    const BlockHash hash = candidate->GetBlockHash();
    BlockIndex* oldTip = m_chain.Tip();

    // Events of an abandoned attempt are never delivered
    std::vector<PendingEvent> local;
    std::vector<TransactionRef> disconnectedTxs;
    std::vector<BlockIndex*> disconnected;

    while (m_chain.Tip() && m_chain.Tip() != fork) {
        BlockIndex* tip = m_chain.Tip();
        StepResult step = DisconnectTip(local, disconnectedTxs);
        if (!step.ok) {
            return step.failure;
        }
        disconnected.push_back(tip);
    }

    std::vector<BlockIndex*> toConnect;
    for (BlockIndex* p = candidate; p && p != fork; p = p->pprev) {
        toConnect.push_back(p);
    }
    std::reverse(toConnect.begin(), toConnect.end());

    ChainResult failure;
    bool failed = false;
    for (BlockIndex* pindex : toConnect) {
        Block block;
        if (pindex == candidate) {
            block = candidateBlock;
        } else {
            db::Status s = m_blocks.ReadBlock(pindex->GetBlockHash(), block);
            if (!s.ok()) {
                if (s.IsCorruption()) {
                    return Halt(pindex->GetBlockHash(), "block store corruption: " + s.ToString());
                }
                failure = ChainResult::Storage(pindex->GetBlockHash(), db::ToStorageError(s),
                                               s.ToString());
                failed = true;
                break;
            }
        }
        StepResult step = ConnectTip(pindex, block, local);
        if (!step.ok) {
            if (step.fatal) {
                return step.failure;
            }
            if (step.failure.validation != ValidationError::NONE) {
                InvalidateBlock(pindex);
            }
            failure = step.failure;
            failed = true;
            break;
        }
    }

    if (failed) {
        LOG_WARN(util::LogCategory::CHAIN) << "Reorganization to " << hash.ToHex()
                                           << " failed, restoring " << oldTip->GetBlockHash().ToHex();
        std::vector<PendingEvent> discard;
        std::vector<TransactionRef> discardTxs;
        while (m_chain.Tip() && m_chain.Tip() != fork) {
            StepResult step = DisconnectTip(discard, discardTxs);
            if (!step.ok) {
                return step.failure;
            }
        }
        for (auto it = disconnected.rbegin(); it != disconnected.rend(); ++it) {
            Block block;
            db::Status s = m_blocks.ReadBlock((*it)->GetBlockHash(), block);
            if (!s.ok()) {
                return Halt((*it)->GetBlockHash(), "cannot restore block: " + s.ToString());
            }
            StepResult step = ConnectTip(*it, block, discard);
            if (!step.ok) {
                if (step.fatal) {
                    return step.failure;
                }
                return Halt((*it)->GetBlockHash(),
                            "previous chain failed to reconnect: " + step.failure.ToString());
            }
        }
        failure.hash = hash;
        return failure;
    }

    ++m_generation;
    UpdateTip(candidate);
    events.insert(events.end(), local.begin(), local.end());

    LOG_INFO(util::LogCategory::CHAIN) << "Reorganized from " << oldTip->GetBlockHash().ToHex()
                                       << " (height " << oldTip->nHeight << ") to " << hash.ToHex()
                                       << " (height " << candidate->nHeight << "), fork at height "
                                       << fork->nHeight << ", " << disconnected.size()
                                       << " disconnected, " << toConnect.size() << " connected";

    ChainResult result = ChainResult::Accepted(hash, candidate->nHeight, true);
    result.disconnectedTxs = std::move(disconnectedTxs);
    return result;
}

// ============================================================================
// Tip Publication
// ============================================================================

void ChainStateManager::UpdateTip(BlockIndex* pindex) {
    if (pindex->pprev && pindex->pprev == m_windowTip) {
        m_difficulty.AddBlock(pindex->GetBlockTime());
    } else {
        m_difficulty.Reset();
        for (int64_t t : strata::GetAncestorTimestamps(pindex, m_difficulty.GetParams().windowSize)) {
            m_difficulty.AddBlock(t);
        }
    }
    m_windowTip = pindex;

    m_checkpoints.UpdateForTip(pindex);
    PublishSnapshot();

    LOG_INFO(util::LogCategory::CHAIN) << "New tip " << pindex->GetBlockHash().ToHex()
                                       << " height " << pindex->nHeight
                                       << " txs " << pindex->nTx;
}

void ChainStateManager::PublishSnapshot() {
    auto snapshot = std::make_shared<ChainSnapshot>();
    const BlockIndex* tip = m_chain.Tip();
    if (tip) {
        snapshot->height = tip->nHeight;
        snapshot->tip = tip->GetBlockHash();
        snapshot->chainWork = tip->nChainWork;
        snapshot->medianTimePast = tip->GetMedianTimePast();
    }
    snapshot->generation = m_generation;
    std::atomic_store(&m_snapshot, std::shared_ptr<const ChainSnapshot>(std::move(snapshot)));
}

ChainResult ChainStateManager::Halt(const BlockHash& hash, const std::string& reason) {
    m_halted.store(true);
    LOG_FATAL(util::LogCategory::CHAIN) << "Chain state halted at block " << hash.ToHex() << ": "
                                        << reason;
    return ChainResult::Rejected(hash, ChainError::UNDO_CORRUPTION, reason);
}

void ChainStateManager::UpdateCommitment(int32_t heightBefore, int32_t heightAfter) {
    const int32_t interval = m_config.commitmentInterval;
    if (interval <= 0) {
        return;
    }
    // Recompute whenever the tip lands on or moves across a multiple of the interval
    const bool boundary = heightAfter % interval == 0 ||
                          std::max(heightBefore, 0) / interval != heightAfter / interval;
    if (!boundary) {
        return;
    }
    if (!m_utxo.Commit()) {
        LOG_ERROR(util::LogCategory::CHAIN) << "Coin set commitment failed at height " << heightAfter;
    }
}

void ChainStateManager::FireEvents(const std::vector<PendingEvent>& events) {
    for (const PendingEvent& ev : events) {
        if (ev.kind == PendingEvent::Kind::DISCONNECTED) {
            m_events.NotifyBlockDisconnected(ev.hash, ev.block);
        } else {
            m_events.NotifyBlockConnected(ev.block, ev.height);
        }
    }
}

int64_t ChainStateManager::Now() const {
    if (m_config.clock) {
        return m_config.clock();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<const ChainSnapshot> ChainStateManager::GetSnapshot() const {
    return std::atomic_load(&m_snapshot);
}

const BlockIndex* ChainStateManager::GetBlockIndex(const BlockHash& hash) const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return LookupBlockIndex(hash);
}

const BlockIndex* ChainStateManager::GetActiveIndex(int32_t height) const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return m_chain[height];
}

bool ChainStateManager::IsInActiveChain(const BlockHash& hash) const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return m_chain.Contains(LookupBlockIndex(hash));
}

bool ChainStateManager::ReadBlock(const BlockHash& hash, Block& block) const {
    return m_blocks.ReadBlock(hash, block).ok();
}

std::vector<int64_t> ChainStateManager::GetAncestorTimestamps(const BlockIndex* index,
                                                              size_t count) const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return strata::GetAncestorTimestamps(index, count);
}

uint32_t ChainStateManager::NextWorkRequired(const BlockIndex* parent) const {
    if (!parent) {
        return m_params.nPowLimitBits;
    }
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    const int height = parent->nHeight + 1;

    // The sliding window mirrors the active tip
    if (parent == m_windowTip) {
        return m_difficulty.NextTargetFromWindow(height, parent->nBits);
    }
    const auto& dp = m_difficulty.GetParams();
    const size_t span = (height % dp.interval == 0) ? static_cast<size_t>(dp.interval)
                                                    : static_cast<size_t>(dp.movingAverageWindow);
    return m_difficulty.NextTarget(strata::GetAncestorTimestamps(parent, span), height,
                                   parent->nBits);
}

size_t ChainStateManager::OrphanCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return m_orphans.Size();
}

size_t ChainStateManager::BlockIndexSize() const {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    return m_blockIndex.size();
}

void ChainStateManager::AddCheckpoint(int32_t height, const BlockHash& hash) {
    std::lock_guard<std::recursive_mutex> lock(m_cs);
    m_checkpoints.AddCheckpoint(height, hash);
}

} // namespace strata
