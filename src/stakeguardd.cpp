// STAKEGUARD - Stake Management Daemon
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Monitors one validator's stake position and node health, and claims or
// restakes automatically when the configured thresholds are met.
//
// Usage: stakeguardd [options] [tmux]

#include "stakeguard/chain/wallet.h"
#include "stakeguard/exec/command.h"
#include "stakeguard/market/price_feed.h"
#include "stakeguard/net/http_client.h"
#include "stakeguard/node/coordinator.h"
#include "stakeguard/node/settings.h"
#include "stakeguard/node/state.h"
#include "stakeguard/notify/notifier.h"
#include "stakeguard/staking/anomaly.h"
#include "stakeguard/staking/decision.h"
#include "stakeguard/staking/epoch.h"
#include "stakeguard/ui/status_view.h"
#include "stakeguard/util/config.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/threadpool.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace stakeguard {

static const char* VERSION = "1.0.0";

// ============================================================================
// Signal Handling
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);  // Ignore broken pipe
}

// ============================================================================
// Help
// ============================================================================

void PrintUsage() {
    std::cout << "Usage: stakeguardd [options] [tmux]\n"
              << "\n"
              << "Options:\n"
              << "  -conf=<file>   Configuration file (default: "
              << util::DEFAULT_CONFIG_FILENAME << ")\n"
              << "  -debug         Log debug messages to the console\n"
              << "  -tmux          Publish status to the tmux status bar\n"
              << "  -nostatus      Do not draw the terminal status view\n"
              << "  -version       Print version and exit\n"
              << "  -help          Print this help and exit\n";
}

// ============================================================================
// Daemon Initialization
// ============================================================================

bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    // First pass only locates the config file
    util::ConfigManager args;
    util::ConfigParseResult result = args.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }

    std::string path = args.GetString("conf", util::DEFAULT_CONFIG_FILENAME);
    bool explicitPath = args.HasKey("conf");

    if (access(path.c_str(), F_OK) == 0) {
        result = config.ParseFile(path);
        if (!result.success) {
            std::cerr << "Error: " << result.ToString() << "\n";
            return false;
        }
    } else if (explicitPath) {
        std::cerr << "Error: Configuration file not found: " << path << "\n";
        return false;
    }

    // Command line overrides the file
    return config.ParseCommandLine(argc, argv).success;
}

void SetupLogging(const node::Settings& settings, const std::string& password) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Debug);

    // Registered before any sink exists so nothing can leak
    logger.AddRedaction(password);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = settings.logLevel;
    consoleConfig.useColors = isatty(STDOUT_FILENO) != 0;
    consoleConfig.useStderr = true;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    if (!settings.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = settings.logFile;
        fileConfig.level = util::LogLevel::Debug;  // Always log debug to file
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_WARN(util::LogCategory::DEFAULT) << "Cannot open log file: " << settings.logFile;
        }
    }
}

void LogStartupBanner(const node::Settings& settings,
                      const std::vector<std::string>& channels) {
    std::ostringstream services;
    if (channels.empty()) {
        services << "None";
    }
    for (size_t i = 0; i < channels.size(); ++i) {
        if (i > 0) services << " ";
        services << channels[i];
    }

    auto yesNo = [](bool value) { return value ? "True" : "False"; };

    LOG_INFO(util::LogCategory::DEFAULT) << "STAKEGUARD Daemon v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << std::string(47, '=');
    LOG_INFO(util::LogCategory::DEFAULT) << "Enable tmux Support:     " << yesNo(settings.enableTmux);
    LOG_INFO(util::LogCategory::DEFAULT) << "Auto Staking Rewards:    "
                                         << yesNo(settings.decision.autoStakeRewards);
    LOG_INFO(util::LogCategory::DEFAULT) << "Auto Restake to Reclaim: "
                                         << yesNo(settings.decision.autoReclaimFullRestakes);
    LOG_INFO(util::LogCategory::DEFAULT) << "Enabled Notifications:   " << services.str();
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintUsage();
        return 0;
    }
    if (config.GetBool("version", false)) {
        std::cout << "STAKEGUARD Daemon v" << VERSION << "\n";
        return 0;
    }

    node::Settings settings = node::LoadSettings(config);

    auto password = node::ResolveWalletPassword(settings.pwdVarName, util::DEFAULT_ENV_FILENAME);
    if (!password) {
        std::cerr << "Error: Wallet password not found. Set " << settings.pwdVarName
                  << " in the environment or in " << util::DEFAULT_ENV_FILENAME << "\n";
        return 1;
    }

    SetupLogging(settings, *password);
    SetupSignalHandlers();

    // External boundaries
    exec::ProcessExecutor executor(settings.commandTimeout);

    net::HttpClient::Config httpConfig;
    httpConfig.timeout = settings.notifyTimeout;
    net::HttpClient http(httpConfig);

    util::ThreadPool::Config queryPoolConfig;
    queryPoolConfig.name = "query";
    util::ThreadPool queryPool(queryPoolConfig);

    util::ThreadPool::Config notifyPoolConfig;
    notifyPoolConfig.numThreads = 2;
    notifyPoolConfig.name = "notify";
    util::ThreadPool notifyPool(notifyPoolConfig);

    chain::WalletAdapter::Config walletConfig;
    walletConfig.walletBinary = settings.walletBinary;
    walletConfig.queryBinary = settings.queryBinary;
    walletConfig.password = *password;
    walletConfig.useSudo = settings.useSudo;
    chain::WalletAdapter wallet(executor, queryPool, walletConfig);

    market::CoinGeckoFeed feed(http, settings.market);

    notify::NotificationService notifier(notifyPool);
    if (!settings.discordWebhook.empty()) {
        notifier.AddChannel(std::make_unique<notify::WebhookChannel>(
            http, "Discord", settings.discordWebhook));
    }
    if (!settings.webhookUrl.empty()) {
        notifier.AddChannel(std::make_unique<notify::WebhookChannel>(
            http, "Webhook", settings.webhookUrl));
    }

    LogStartupBanner(settings, notifier.ChannelNames());

    // Core
    util::CancellationToken token;
    node::StateStore store;
    staking::AnomalyDetector detector(settings.minPeers);
    staking::EpochScheduler scheduler(store, token);
    staking::DecisionEngine engine(wallet, store, notifier, settings.decision, &token);
    node::Poller poller(wallet, feed, store, notifier, detector);

    // Presentation
    std::vector<ui::IStatusView*> views;
    ui::TerminalView terminal(std::cout, isatty(STDOUT_FILENO) != 0);
    if (config.GetBool("status", true)) {
        views.push_back(&terminal);
    }
    std::unique_ptr<ui::TmuxStatusView> tmux;
    if (settings.enableTmux) {
        tmux = std::make_unique<ui::TmuxStatusView>(executor, settings.statusBar);
        views.push_back(tmux.get());
    }

    poller.InitialRefresh();

    node::LoopCoordinator coordinator(poller, engine, scheduler, store, views, token);
    coordinator.Start();

    while (!g_shutdownRequested.load()) {
        token.WaitFor(util::Milliseconds(200));
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown requested; waiting for loops to finish";
    coordinator.Stop();
    coordinator.Join();

    notifier.Flush();
    notifyPool.Shutdown();
    queryPool.Shutdown();

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();

    std::cout << "\n\nCTRL-C detected. Exiting gracefully.\n" << std::endl;
    return 0;
}

} // namespace stakeguard

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return stakeguard::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
