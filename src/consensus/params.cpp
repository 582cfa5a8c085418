// STRATA - Consensus Parameters Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/consensus/params.h"
#include <stdexcept>

namespace strata {
namespace consensus {

Block Params::GenesisBlock() const {
    return CreateGenesisBlock(nGenesisTime, nGenesisNonce, nPowLimitBits,
                              nGenesisVersion, nGenesisReward);
}

Params Params::Main() {
    Params params;
    params.strNetworkID = "main";

    params.nPowTargetSpacing = 150;
    params.nMaxBlockSize = 4 * 1000 * 1000;
    params.nMaxTxSize = 1000 * 1000;

    params.nPowLimitBits = 0x1e0fffff;
    params.nDifficultyInterval = 2016;
    params.nMovingAverageWindow = 17;
    params.nMaxAdjustmentFactor = 4;

    params.nSubsidyHalvingInterval = 840000;
    params.nInitialBlockReward = 50 * COIN;
    params.nCoinbaseMaturity = 100;

    params.nGenesisTime = 1704067200;  // 2024-01-01 00:00:00 UTC
    params.nGenesisNonce = 0;
    params.nGenesisVersion = 1;
    params.nGenesisReward = 50 * COIN;
    params.hashGenesisBlock = params.GenesisBlock().GetHash();
    params.checkpoints[0] = params.hashGenesisBlock;

    return params;
}

Params Params::RegTest() {
    Params params;
    params.strNetworkID = "regtest";

    params.nPowTargetSpacing = 30;
    params.nMaxBlockSize = 4 * 1000 * 1000;
    params.nMaxTxSize = 1000 * 1000;

    params.nPowLimitBits = 0x207fffff;
    params.nDifficultyInterval = 144;
    params.nMovingAverageWindow = 17;
    params.nMaxAdjustmentFactor = 4;

    params.nSubsidyHalvingInterval = 150;
    params.nInitialBlockReward = 50 * COIN;
    params.nCoinbaseMaturity = 1;

    params.nGenesisTime = 1704067200;
    params.nGenesisNonce = 0;
    params.nGenesisVersion = 1;
    params.nGenesisReward = 50 * COIN;
    params.hashGenesisBlock = params.GenesisBlock().GetHash();
    params.checkpoints[0] = params.hashGenesisBlock;

    return params;
}

Params Params::ForNetwork(const std::string& name) {
    if (name == "main" || name == "mainnet") {
        return Main();
    }
    if (name == "regtest") {
        return RegTest();
    }
    throw std::invalid_argument("unknown network: " + name);
}

// ============================================================================
// Block Subsidy Calculation
// ============================================================================

Amount GetBlockSubsidy(int nHeight, const Params& params) {
    if (nHeight < 0 || params.nSubsidyHalvingInterval <= 0) {
        return 0;
    }

    int halvings = nHeight / params.nSubsidyHalvingInterval;
    if (halvings >= 64) {
        return 0;
    }

    Amount subsidy = params.nInitialBlockReward;
    subsidy >>= halvings;
    return subsidy;
}

} // namespace consensus
} // namespace strata
