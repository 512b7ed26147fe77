// STAKEGUARD - Daemon Settings
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Typed view of the configuration file and command line.

#ifndef STAKEGUARD_NODE_SETTINGS_H
#define STAKEGUARD_NODE_SETTINGS_H

#include "stakeguard/market/price_feed.h"
#include "stakeguard/staking/decision.h"
#include "stakeguard/ui/status_view.h"
#include "stakeguard/util/logging.h"

#include <chrono>
#include <optional>
#include <string>

namespace stakeguard {

namespace util {
class ConfigManager;
}

namespace node {

/// Configuration sections
namespace Section {
    constexpr const char* GENERAL = "general";
    constexpr const char* NOTIFICATIONS = "notifications";
    constexpr const char* STATUSBAR = "statusbar";
    constexpr const char* MARKET = "market";
}

/// Variable consulted when the configured credential variable is unset
constexpr const char* DEFAULT_PASSWORD_VARIABLE = "WALLET_PASSWORD";

struct Settings {
    staking::DecisionConfig decision;
    int64_t minPeers{10};

    std::string pwdVarName{DEFAULT_PASSWORD_VARIABLE};
    bool useSudo{false};
    bool enableTmux{false};
    std::string walletBinary{"rusk-wallet"};
    std::string queryBinary{"ruskquery"};
    std::chrono::seconds commandTimeout{120};

    std::string logFile{"actions.log"};
    util::LogLevel logLevel{util::LogLevel::Info};

    std::string webhookUrl;
    std::string discordWebhook;
    std::chrono::seconds notifyTimeout{10};

    ui::StatusBarFields statusBar;
    market::CoinGeckoFeed::Config market;
};

/**
 * Read settings from a parsed configuration, applying defaults for absent
 * keys. The positional argument "tmux" or the flag "-tmux" enables the
 * status bar regardless of the file, and "-debug" lowers the log level.
 */
Settings LoadSettings(const util::ConfigManager& config);

/**
 * Resolve the wallet password: the variable named `varName`, then
 * WALLET_PASSWORD, then the same two keys in the KEY=VALUE file at
 * `envFilePath`.
 */
std::optional<std::string> ResolveWalletPassword(const std::string& varName,
                                                 const std::string& envFilePath);

/// Parse KEY=VALUE lines; blank lines and '#' comments are skipped
std::optional<std::string> ReadEnvFileValue(const std::string& path, const std::string& key);

} // namespace node
} // namespace stakeguard

#endif // STAKEGUARD_NODE_SETTINGS_H
