// STRATA - Node Context Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/node/context.h"
#include "strata/crypto/ecdsa.h"
#include "strata/db/memorydb.h"

#include <stdexcept>
#include <system_error>
#include <thread>

namespace strata {

// ============================================================================
// Configuration
// ============================================================================

namespace {

size_t ReadSize(const util::ConfigManager& config, const std::string& key, size_t defaultValue) {
    const int64_t value = config.GetInt(key, static_cast<int64_t>(defaultValue));
    if (value < 0) {
        throw std::invalid_argument("-" + key + " must not be negative");
    }
    return static_cast<size_t>(value);
}

Amount ReadAmount(const util::ConfigManager& config, const std::string& key, Amount defaultValue) {
    const int64_t value = config.GetInt(key, defaultValue);
    if (value < 0 || !MoneyRange(value)) {
        throw std::invalid_argument("-" + key + " is out of range");
    }
    return value;
}

bool CreateDirectoryIfNeeded(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot create " << path.string()
                                              << ": " << ec.message();
        return false;
    }
    return true;
}

std::unique_ptr<db::Database> OpenStore(const NodeContext& node, const std::string& name) {
    if (node.config.inMemory) {
        return std::make_unique<db::MemoryDatabase>();
    }

    const std::filesystem::path path = node.config.dataDir / name;
    if (!CreateDirectoryIfNeeded(path)) {
        return nullptr;
    }

    db::Options options;
    options.create_if_missing = true;
    options.max_open_files = 64;

    auto opened = db::OpenDatabase(path, options);
    if (!opened.first.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string() << ": "
                                         << opened.first.ToString();
        return nullptr;
    }
    LOG_INFO(util::LogCategory::DB) << "Opened " << path.string();
    return std::move(opened.second);
}

} // namespace

CoreConfig LoadCoreConfig(const util::ConfigManager& config) {
    namespace Keys = util::ConfigKeys;
    CoreConfig core;

    core.network = config.GetString(Keys::NETWORK, core.network);
    if (core.network != "main" && core.network != "regtest") {
        throw std::invalid_argument("unknown network: " + core.network);
    }

    core.dataDir = config.GetString(Keys::DATADIR, core.dataDir.string());
    core.inMemory = config.GetBool(Keys::INMEMORY, core.inMemory);
    if (!core.inMemory && core.dataDir.empty()) {
        throw std::invalid_argument("-datadir is required unless -inmemory is set");
    }

    core.logLevel = config.GetString(Keys::DEBUG, core.logLevel);
    core.logFile = config.GetString(Keys::LOGFILE, core.logFile);
    core.printToConsole = config.GetBool(Keys::PRINTTOCONSOLE, core.printToConsole);

    core.dbCache = ReadSize(config, Keys::DBCACHE, core.dbCache);
    if (core.dbCache == 0) {
        throw std::invalid_argument("-dbcache must be positive");
    }
    core.validationThreads = ReadSize(config, Keys::PAR, core.validationThreads);

    core.chain.parallelThreshold = ReadSize(config, Keys::PARTHRESHOLD, core.chain.parallelThreshold);
    core.chain.maxOrphans = ReadSize(config, Keys::MAXORPHANS, core.chain.maxOrphans);
    const int64_t interval = config.GetInt(Keys::CHECKPOINTINTERVAL, core.chain.checkpointInterval);
    if (interval < 0 || interval > INT32_MAX) {
        throw std::invalid_argument("-checkpointinterval is out of range");
    }
    core.chain.checkpointInterval = static_cast<int32_t>(interval);
    const int64_t commitment = config.GetInt(Keys::COMMITMENTINTERVAL, core.chain.commitmentInterval);
    if (commitment < 0 || commitment > INT32_MAX) {
        throw std::invalid_argument("-commitmentinterval is out of range");
    }
    core.chain.commitmentInterval = static_cast<int32_t>(commitment);

    MempoolLimits& limits = core.mempool;
    limits.maxBytes = ReadSize(config, Keys::MAXMEMPOOL, limits.maxBytes);
    limits.maxTransactions = ReadSize(config, Keys::MAXMEMPOOLTX, limits.maxTransactions);
    limits.ttl = config.GetInt(Keys::MEMPOOLEXPIRY, limits.ttl);
    if (limits.ttl <= 0) {
        throw std::invalid_argument("-mempoolexpiry must be positive");
    }
    limits.minFeeRate = FeeRate(ReadAmount(config, Keys::MINRELAYFEE, limits.minFeeRate.GetFeePerK()));
    limits.incrementalRelayFee =
        FeeRate(ReadAmount(config, Keys::INCREMENTALRELAYFEE, limits.incrementalRelayFee.GetFeePerK()));
    limits.enableReplacement = config.GetBool(Keys::MEMPOOLREPLACEMENT, limits.enableReplacement);
    limits.minRbfIncreasePercent = config.GetInt(Keys::RBFINCREASE, limits.minRbfIncreasePercent);
    if (limits.minRbfIncreasePercent < 0) {
        throw std::invalid_argument("-rbfincrease must not be negative");
    }
    limits.maxReplacements = ReadSize(config, Keys::MAXREPLACEMENTS, limits.maxReplacements);

    return core;
}

util::LoggingOptions MakeLoggingOptions(const CoreConfig& config) {
    util::LoggingOptions options;
    options.level = util::LogLevelFromString(config.logLevel);
    options.console = config.printToConsole;
    if (!config.logFile.empty()) {
        options.file = config.logFile;
    } else if (!config.inMemory && !config.dataDir.empty()) {
        options.file = (config.dataDir / "debug.log").string();
    }
    return options;
}

// ============================================================================
// NodeContext
// ============================================================================

NodeContext::~NodeContext() {
    if (initialized.load()) {
        ShutdownNode(*this);
    }
}

// ============================================================================
// Initialization
// ============================================================================

bool InitializeNode(NodeContext& node, const CoreConfig& config,
                    std::unique_ptr<consensus::SignatureVerifier> verifier) {
    if (node.initialized.load()) {
        LOG_WARN(util::LogCategory::DEFAULT) << "Node is already initialized";
        return false;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing node...";
    node.config = config;

    // ========================================================================
    // Step 1: Consensus parameters
    // ========================================================================

    try {
        node.params = std::make_unique<consensus::Params>(consensus::Params::ForNetwork(config.network));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << e.what();
        return false;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Network: " << config.network
                                         << " (genesis: " << node.params->hashGenesisBlock.ToHex().substr(0, 16)
                                         << "...)";

    // ========================================================================
    // Step 2: Storage
    // ========================================================================

    node.blockDB = OpenStore(node, "blocks");
    node.chainstateDB = OpenStore(node, "chainstate");
    if (!node.blockDB || !node.chainstateDB) {
        ShutdownNode(node);
        return false;
    }
    node.blockStore = std::make_unique<db::BlockStore>(*node.blockDB);
    node.coinStore = std::make_unique<db::CoinStore>(*node.chainstateDB);
    node.utxo = std::make_unique<UtxoSet>(*node.coinStore, config.dbCache);

    // ========================================================================
    // Step 3: Validation resources
    // ========================================================================

    if (config.validationThreads != 1) {
        util::ThreadPool::Config poolConfig;
        poolConfig.numThreads = config.validationThreads;
        poolConfig.name = "validation";
        node.validationPool = std::make_unique<util::ThreadPool>(poolConfig);
        LOG_INFO(util::LogCategory::VALIDATION) << "Validation threads: "
                                                << node.validationPool->ThreadCount();
    }
    node.verifier = verifier ? std::move(verifier) : std::make_unique<EcdsaVerifier>();

    // ========================================================================
    // Step 4: Chain state
    // ========================================================================

    node.chainman = std::make_unique<ChainStateManager>(
        *node.params, *node.utxo, *node.blockStore, *node.verifier,
        node.validationPool.get(), config.chain);

    if (node.blockStore->ReadBestChain().has_value()) {
        if (!node.chainman->LoadFromStore()) {
            LOG_ERROR(util::LogCategory::CHAIN) << "Stored chain could not be loaded";
            ShutdownNode(node);
            return false;
        }
    } else {
        ChainResult result = node.chainman->Initialize(node.params->GenesisBlock());
        if (!result.IsSuccess()) {
            LOG_ERROR(util::LogCategory::CHAIN) << "Genesis block rejected: " << result.ToString();
            ShutdownNode(node);
            return false;
        }
    }
    LOG_INFO(util::LogCategory::CHAIN) << "Chain tip: height=" << node.chainman->GetHeight()
                                       << " hash=" << node.chainman->GetTip().ToHex();

    // ========================================================================
    // Step 5: Mempool
    // ========================================================================

    node.mempool = std::make_unique<Mempool>(*node.utxo, *node.verifier, config.mempool,
                                             node.chainman.get(), node.params->nCoinbaseMaturity);

    node.initialized = true;
    LOG_INFO(util::LogCategory::DEFAULT) << "Node initialized";
    return true;
}

// ============================================================================
// Shutdown
// ============================================================================

bool FlushNodeState(NodeContext& node) {
    bool ok = true;
    if (node.utxo) {
        db::Status status = node.utxo->Flush();
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::UTXO) << "Coin flush failed: " << status.ToString();
            ok = false;
        }
    }
    if (node.blockStore) {
        db::Status status = node.blockStore->Flush();
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Block flush failed: " << status.ToString();
            ok = false;
        }
    }
    return ok;
}

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down node...";
    node.shutdownRequested = true;

    // Unsubscribes from chain events
    node.mempool.reset();

    if (node.validationPool) {
        node.validationPool->Shutdown();
    }

    FlushNodeState(node);

    node.chainman.reset();
    node.verifier.reset();
    node.validationPool.reset();
    node.utxo.reset();
    node.coinStore.reset();
    node.blockStore.reset();
    node.chainstateDB.reset();
    node.blockDB.reset();
    node.params.reset();

    node.initialized = false;
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
}

void RequestShutdown(NodeContext& node) {
    node.shutdownRequested = true;
}

bool IsShutdownRequested(const NodeContext& node) {
    return node.shutdownRequested.load();
}

} // namespace strata
