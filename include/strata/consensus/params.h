// STRATA - Consensus Parameters Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the consensus parameters for STRATA networks.
// These parameters control block timing, rewards and difficulty.

#ifndef STRATA_CONSENSUS_PARAMS_H
#define STRATA_CONSENSUS_PARAMS_H

#include "strata/core/block.h"
#include "strata/core/types.h"
#include <cstdint>
#include <map>
#include <string>

namespace strata {
namespace consensus {

// ============================================================================
// Consensus Parameters
// ============================================================================

/// Parameters that influence chain consensus
struct Params {
    // ========================================================================
    // Network Identification
    // ========================================================================

    /// Network name (main, regtest)
    std::string strNetworkID;

    BlockHash hashGenesisBlock;

    // Inputs to CreateGenesisBlock
    uint32_t nGenesisTime{0};
    uint32_t nGenesisNonce{0};
    int32_t nGenesisVersion{1};
    Amount nGenesisReward{0};

    // ========================================================================
    // Block Parameters
    // ========================================================================

    /// Target time between blocks in seconds
    int64_t nPowTargetSpacing{150};

    /// Maximum serialized block size in bytes
    uint32_t nMaxBlockSize{4 * 1000 * 1000};

    /// Maximum serialized transaction size in bytes
    uint32_t nMaxTxSize{1000 * 1000};

    /// Blocks a header's timestamp may not precede the median of
    int nMedianTimeSpan{11};

    /// How far ahead of local time a block timestamp may be, in seconds
    int64_t nMaxFutureBlockTime{2 * 60 * 60};

    // ========================================================================
    // Proof of Work Parameters
    // ========================================================================

    /// Easiest allowed target, compact form
    uint32_t nPowLimitBits{0x1e0fffff};

    /// Blocks between full difficulty recalculations
    int nDifficultyInterval{2016};

    /// Timestamps feeding the between-interval moving average
    int nMovingAverageWindow{17};

    /// Largest factor the target may move by in one adjustment
    int64_t nMaxAdjustmentFactor{4};

    // ========================================================================
    // Rewards
    // ========================================================================

    /// Block subsidy halving interval (in blocks)
    int nSubsidyHalvingInterval{840000};

    /// Initial block reward in base units
    Amount nInitialBlockReward{50 * COIN};

    /// Confirmations a coinbase output needs before it can be spent
    int nCoinbaseMaturity{100};

    // ========================================================================
    // Checkpoints
    // ========================================================================

    /// Hard-coded height -> block hash pins
    std::map<int, BlockHash> checkpoints;

    // ========================================================================
    // Helper Methods
    // ========================================================================

    int64_t DifficultyAdjustmentTimespan() const {
        return nPowTargetSpacing * nDifficultyInterval;
    }

    /// Rebuild the genesis block from the stored inputs
    Block GenesisBlock() const;

    // ========================================================================
    // Network Configurations
    // ========================================================================

    static Params Main();
    static Params RegTest();

    /// Main or RegTest by name; throws std::invalid_argument otherwise
    static Params ForNetwork(const std::string& name);
};

// ============================================================================
// Block Subsidy Calculation
// ============================================================================

/// Block subsidy at height: the initial reward halved every
/// nSubsidyHalvingInterval blocks, zero after 64 halvings
Amount GetBlockSubsidy(int nHeight, const Params& params);

} // namespace consensus
} // namespace strata

#endif // STRATA_CONSENSUS_PARAMS_H
