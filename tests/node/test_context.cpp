// STRATA - Node Context Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>

#include <strata/node/context.h>
#include "test_util.h"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace strata {
namespace test {

// ============================================================================
// Configuration
// ============================================================================

class CoreConfigTest : public ::testing::Test {
protected:
    CoreConfig Load(const std::string& text) {
        util::ConfigManager config;
        auto result = config.ParseString(text);
        EXPECT_TRUE(result.success) << result.ToString();
        return LoadCoreConfig(config);
    }

    void ExpectRejected(const std::string& text) {
        util::ConfigManager config;
        ASSERT_TRUE(config.ParseString(text).success);
        EXPECT_THROW(LoadCoreConfig(config), std::invalid_argument) << text;
    }
};

TEST_F(CoreConfigTest, Defaults) {
    CoreConfig core = Load("inmemory=1\n");
    EXPECT_EQ(core.network, "main");
    EXPECT_TRUE(core.inMemory);
    EXPECT_EQ(core.validationThreads, 0u);
    EXPECT_EQ(core.dbCache, UtxoSet::DEFAULT_CACHE_CAPACITY);
    EXPECT_TRUE(core.mempool.enableReplacement);
}

TEST_F(CoreConfigTest, ReadsEveryKey) {
    CoreConfig core = Load(
        "network=regtest\n"
        "datadir=/tmp/strata\n"
        "debug=trace\n"
        "logfile=/tmp/strata.log\n"
        "noprinttoconsole\n"
        "dbcache=5000\n"
        "par=3\n"
        "parthreshold=16\n"
        "maxorphans=20\n"
        "checkpointinterval=50\n"
        "commitmentinterval=144\n"
        "maxmempool=2m\n"
        "maxmempooltx=500\n"
        "mempoolexpiry=3600\n"
        "minrelayfee=2000\n"
        "incrementalrelayfee=1500\n"
        "nomempoolreplacement\n"
        "rbfincrease=25\n"
        "maxreplacements=7\n");

    EXPECT_EQ(core.network, "regtest");
    EXPECT_EQ(core.dataDir, std::filesystem::path("/tmp/strata"));
    EXPECT_FALSE(core.inMemory);
    EXPECT_EQ(core.logLevel, "trace");
    EXPECT_EQ(core.logFile, "/tmp/strata.log");
    EXPECT_FALSE(core.printToConsole);
    EXPECT_EQ(core.dbCache, 5000u);
    EXPECT_EQ(core.validationThreads, 3u);
    EXPECT_EQ(core.chain.parallelThreshold, 16u);
    EXPECT_EQ(core.chain.maxOrphans, 20u);
    EXPECT_EQ(core.chain.checkpointInterval, 50);
    EXPECT_EQ(core.chain.commitmentInterval, 144);
    EXPECT_EQ(core.mempool.maxBytes, 2u * 1024 * 1024);
    EXPECT_EQ(core.mempool.maxTransactions, 500u);
    EXPECT_EQ(core.mempool.ttl, 3600);
    EXPECT_EQ(core.mempool.minFeeRate.GetFeePerK(), 2000);
    EXPECT_EQ(core.mempool.incrementalRelayFee.GetFeePerK(), 1500);
    EXPECT_FALSE(core.mempool.enableReplacement);
    EXPECT_EQ(core.mempool.minRbfIncreasePercent, 25);
    EXPECT_EQ(core.mempool.maxReplacements, 7u);
}

TEST_F(CoreConfigTest, RejectsBadValues) {
    ExpectRejected("inmemory=1\nnetwork=testnet\n");
    ExpectRejected("network=regtest\n");
    ExpectRejected("inmemory=1\ndbcache=0\n");
    ExpectRejected("inmemory=1\ndbcache=-1\n");
    ExpectRejected("inmemory=1\npar=-2\n");
    ExpectRejected("inmemory=1\ncheckpointinterval=-1\n");
    ExpectRejected("inmemory=1\ncommitmentinterval=-1\n");
    ExpectRejected("inmemory=1\nmempoolexpiry=0\n");
    ExpectRejected("inmemory=1\nminrelayfee=-5\n");
    ExpectRejected("inmemory=1\nrbfincrease=-1\n");
}

TEST_F(CoreConfigTest, LoggingOptions) {
    CoreConfig core;
    core.dataDir = "/var/lib/strata";
    core.logLevel = "debug";
    core.printToConsole = false;

    util::LoggingOptions options = MakeLoggingOptions(core);
    EXPECT_EQ(options.level, util::LogLevel::Debug);
    EXPECT_FALSE(options.console);
    EXPECT_EQ(options.file, (std::filesystem::path("/var/lib/strata") / "debug.log").string());

    core.logFile = "/tmp/other.log";
    EXPECT_EQ(MakeLoggingOptions(core).file, "/tmp/other.log");

    core.logFile.clear();
    core.inMemory = true;
    EXPECT_TRUE(MakeLoggingOptions(core).file.empty());
}

// ============================================================================
// Lifecycle
// ============================================================================

class NodeContextTest : public ::testing::Test {
protected:
    static CoreConfig RegTestConfig() {
        CoreConfig config;
        config.network = "regtest";
        config.inMemory = true;
        config.validationThreads = 2;
        return config;
    }

    /// Extend node's tip by one empty block
    static ChainResult MineOne(NodeContext& node) {
        ChainStateManager& chain = *node.chainman;
        const BlockIndex* parent = chain.GetBlockIndex(chain.GetTip());
        const int32_t height = parent->nHeight + 1;

        Block block;
        block.nVersion = 1;
        block.hashPrevBlock = chain.GetTip();
        block.nTime = static_cast<uint32_t>(parent->GetBlockTime() + node.params->nPowTargetSpacing);
        block.nBits = chain.NextWorkRequired(parent);
        block.vtx.push_back(MakeCoinbase(height, consensus::GetBlockSubsidy(height, *node.params),
                                         KeyScript(MINER_KEY)));
        block.hashMerkleRoot = block.ComputeMerkleRoot();
        MineBlock(block, *node.params);
        return chain.ProcessBlock(block);
    }
};

TEST_F(NodeContextTest, InitializeInMemory) {
    NodeContext node;
    EXPECT_FALSE(node.IsInitialized());
    EXPECT_EQ(node.GetHeight(), -1);

    ASSERT_TRUE(InitializeNode(node, RegTestConfig(), std::make_unique<TestVerifier>()));
    EXPECT_TRUE(node.IsInitialized());
    EXPECT_EQ(node.GetHeight(), 0);
    EXPECT_EQ(node.chainman->GetTip(), node.params->hashGenesisBlock);
    ASSERT_NE(node.mempool, nullptr);
    EXPECT_EQ(node.GetMempoolSize(), 0u);
    ASSERT_NE(node.validationPool, nullptr);
    EXPECT_EQ(node.validationPool->ThreadCount(), 2u);

    // Second initialization is refused
    EXPECT_FALSE(InitializeNode(node, RegTestConfig(), std::make_unique<TestVerifier>()));

    ASSERT_TRUE(MineOne(node).IsSuccess());
    EXPECT_EQ(node.GetHeight(), 1);
    EXPECT_TRUE(FlushNodeState(node));

    ShutdownNode(node);
    EXPECT_FALSE(node.IsInitialized());
    EXPECT_EQ(node.GetHeight(), -1);
    ShutdownNode(node);
}

TEST_F(NodeContextTest, SequentialValidationHasNoPool) {
    CoreConfig config = RegTestConfig();
    config.validationThreads = 1;

    NodeContext node;
    ASSERT_TRUE(InitializeNode(node, config, std::make_unique<TestVerifier>()));
    EXPECT_EQ(node.validationPool, nullptr);
}

TEST_F(NodeContextTest, UnknownNetworkFails) {
    CoreConfig config = RegTestConfig();
    config.network = "nowhere";

    NodeContext node;
    EXPECT_FALSE(InitializeNode(node, config, std::make_unique<TestVerifier>()));
    EXPECT_FALSE(node.IsInitialized());
}

TEST_F(NodeContextTest, ShutdownRequest) {
    NodeContext node;
    EXPECT_FALSE(IsShutdownRequested(node));
    RequestShutdown(node);
    EXPECT_TRUE(IsShutdownRequested(node));
}

TEST_F(NodeContextTest, ChainSurvivesRestart) {
    const std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / "strata_node_test";
    std::filesystem::remove_all(dir);

    CoreConfig config = RegTestConfig();
    config.inMemory = false;
    config.dataDir = dir;

    BlockHash tip;
    {
        NodeContext node;
        ASSERT_TRUE(InitializeNode(node, config, std::make_unique<TestVerifier>()));
        ASSERT_TRUE(MineOne(node).IsSuccess());
        ASSERT_TRUE(MineOne(node).IsSuccess());
        tip = node.chainman->GetTip();
        ShutdownNode(node);
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "blocks"));
    EXPECT_TRUE(std::filesystem::exists(dir / "chainstate"));

    {
        NodeContext node;
        ASSERT_TRUE(InitializeNode(node, config, std::make_unique<TestVerifier>()));
        EXPECT_EQ(node.GetHeight(), 2);
        EXPECT_EQ(node.chainman->GetTip(), tip);
    }

    std::filesystem::remove_all(dir);
}

} // namespace test
} // namespace strata
