// STRATA - Node Context
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the NodeContext structure that owns every component of
// a running node, and the functions that build it from configuration and
// tear it down again.

#ifndef STRATA_NODE_CONTEXT_H
#define STRATA_NODE_CONTEXT_H

#include "strata/chain/chainstate.h"
#include "strata/chain/utxoset.h"
#include "strata/consensus/params.h"
#include "strata/consensus/validation.h"
#include "strata/db/blockstore.h"
#include "strata/db/coinstore.h"
#include "strata/db/database.h"
#include "strata/mempool/mempool.h"
#include "strata/util/config.h"
#include "strata/util/logging.h"
#include "strata/util/threadpool.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace strata {

// ============================================================================
// Core Configuration
// ============================================================================

/**
 * Settings for the consensus core, read from a config file by
 * LoadCoreConfig(). Defaults match an unconfigured main network node.
 */
struct CoreConfig {
    /// "main" or "regtest"
    std::string network{"main"};

    std::filesystem::path dataDir;

    /// Keep blocks and coins in memory only
    bool inMemory{false};

    /// Log level name (trace, debug, info, warn, error, fatal)
    std::string logLevel{"info"};
    std::string logFile;
    bool printToConsole{true};

    /// UTXO cache capacity in entries
    size_t dbCache{UtxoSet::DEFAULT_CACHE_CAPACITY};

    /// Validation threads; 0 uses every core, 1 validates sequentially
    size_t validationThreads{0};

    ChainConfig chain;
    MempoolLimits mempool;
};

/**
 * Read CoreConfig from parsed configuration.
 * @throws std::invalid_argument on an unknown network or out-of-range value
 */
CoreConfig LoadCoreConfig(const util::ConfigManager& config);

/// Logging setup for config
util::LoggingOptions MakeLoggingOptions(const CoreConfig& config);

// ============================================================================
// Node Context
// ============================================================================

/**
 * Owns the node's components. Members are declared in construction order
 * so that destruction releases the mempool before the chain and the chain
 * before the stores it writes to.
 */
struct NodeContext {
    CoreConfig config;

    std::unique_ptr<consensus::Params> params;

    std::unique_ptr<db::Database> blockDB;
    std::unique_ptr<db::Database> chainstateDB;
    std::unique_ptr<db::BlockStore> blockStore;
    std::unique_ptr<db::CoinStore> coinStore;

    std::unique_ptr<UtxoSet> utxo;
    std::unique_ptr<util::ThreadPool> validationPool;
    std::unique_ptr<consensus::SignatureVerifier> verifier;

    std::unique_ptr<ChainStateManager> chainman;
    std::unique_ptr<Mempool> mempool;

    std::atomic<bool> initialized{false};
    std::atomic<bool> shutdownRequested{false};

    NodeContext() = default;
    ~NodeContext();

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;
    NodeContext(NodeContext&&) = delete;
    NodeContext& operator=(NodeContext&&) = delete;

    bool IsInitialized() const { return initialized.load(); }

    int32_t GetHeight() const { return chainman ? chainman->GetHeight() : -1; }
    size_t GetMempoolSize() const { return mempool ? mempool->Size() : 0; }
};

// ============================================================================
// Lifecycle
// ============================================================================

/**
 * Open storage, restore or create the chain, and start the mempool.
 *
 * @param verifier Signature capability; null selects the ECDSA verifier
 * @return false (with the reason logged) if any component failed
 */
bool InitializeNode(NodeContext& node, const CoreConfig& config,
                    std::unique_ptr<consensus::SignatureVerifier> verifier = nullptr);

/// Write cached coins and block data to disk
bool FlushNodeState(NodeContext& node);

/// Flush, then release components in reverse order. Safe to call twice.
void ShutdownNode(NodeContext& node);

void RequestShutdown(NodeContext& node);
bool IsShutdownRequested(const NodeContext& node);

} // namespace strata

#endif // STRATA_NODE_CONTEXT_H
