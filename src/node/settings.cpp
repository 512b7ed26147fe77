// STAKEGUARD - Daemon Settings Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/node/settings.h"
#include "stakeguard/util/config.h"
#include "stakeguard/util/format.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace stakeguard {
namespace node {

Settings LoadSettings(const util::ConfigManager& config) {
    Settings s;
    const char* g = Section::GENERAL;

    s.decision.minRewards = config.GetDouble("min_rewards", s.decision.minRewards, g);
    s.decision.minSlashed = config.GetDouble("min_slashed", s.decision.minSlashed, g);
    s.decision.minStakeAmount = config.GetDouble("min_stake_amount", s.decision.minStakeAmount, g);
    s.decision.bufferBlocks = config.GetInt("buffer_blocks", s.decision.bufferBlocks, g);
    s.decision.autoStakeRewards = config.GetBool("auto_stake_rewards", false, g);
    s.decision.autoReclaimFullRestakes = config.GetBool("auto_reclaim_full_restakes", false, g);

    s.minPeers = config.GetInt("min_peers", s.minPeers, g);
    s.pwdVarName = config.GetString("pwd_var_name", s.pwdVarName, g);
    s.useSudo = config.GetBool("use_sudo", false, g);
    s.enableTmux = config.GetBool("enable_tmux", false, g);
    s.walletBinary = config.GetString("wallet_binary", s.walletBinary, g);
    s.queryBinary = config.GetString("query_binary", s.queryBinary, g);
    s.commandTimeout = std::chrono::seconds(
        std::max<int64_t>(config.GetInt("command_timeout", s.commandTimeout.count(), g), 1));
    s.logFile = config.GetPath("log_file", s.logFile, g);
    s.logLevel = util::LogLevelFromString(config.GetString("log_level", "info", g));

    const char* n = Section::NOTIFICATIONS;
    s.webhookUrl = config.GetString("webhook_url", "", n);
    s.discordWebhook = config.GetString("discord_webhook", "", n);
    s.notifyTimeout = std::chrono::seconds(
        std::max<int64_t>(config.GetInt("notify_timeout", s.notifyTimeout.count(), n), 1));

    const char* b = Section::STATUSBAR;
    s.statusBar.showCurrentBlock = config.GetBool("show_current_block", true, b);
    s.statusBar.showStaked = config.GetBool("show_staked", true, b);
    s.statusBar.showPublic = config.GetBool("show_public", true, b);
    s.statusBar.showShielded = config.GetBool("show_shielded", true, b);
    s.statusBar.showTotal = config.GetBool("show_total", true, b);
    s.statusBar.showRewards = config.GetBool("show_rewards", true, b);
    s.statusBar.showReclaimable = config.GetBool("show_reclaimable", true, b);
    s.statusBar.showPrice = config.GetBool("show_price", true, b);
    s.statusBar.showTimer = config.GetBool("show_timer", true, b);
    s.statusBar.showTriggerTime = config.GetBool("show_trigger_time", true, b);
    s.statusBar.showPeerCount = config.GetBool("show_peer_count", true, b);

    const char* m = Section::MARKET;
    s.market.priceUrl = config.GetString("price_url", s.market.priceUrl, m);
    s.market.assetId = config.GetString("asset_id", s.market.assetId, m);
    s.market.vsCurrency = config.GetString("vs_currency", s.market.vsCurrency, m);

    // Command line
    const auto& positional = config.GetPositionalArgs();
    if (config.GetBool("tmux", false) ||
        std::find(positional.begin(), positional.end(), "tmux") != positional.end()) {
        s.enableTmux = true;
    }
    if (config.GetBool("debug", false)) {
        s.logLevel = util::LogLevel::Debug;
    }

    return s;
}

std::optional<std::string> ReadEnvFileValue(const std::string& path, const std::string& key) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = util::Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = util::Trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || util::Trim(line.substr(0, eq)) != key) {
            continue;
        }

        std::string value = util::Trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }

    return std::nullopt;
}

std::optional<std::string> ResolveWalletPassword(const std::string& varName,
                                                 const std::string& envFilePath) {
    std::vector<std::string> keys;
    if (!varName.empty()) {
        keys.push_back(varName);
    }
    if (varName != DEFAULT_PASSWORD_VARIABLE) {
        keys.push_back(DEFAULT_PASSWORD_VARIABLE);
    }

    for (const auto& key : keys) {
        const char* value = std::getenv(key.c_str());
        if (value && *value) {
            return std::string(value);
        }
    }

    for (const auto& key : keys) {
        auto value = ReadEnvFileValue(envFilePath, key);
        if (value && !value->empty()) {
            return value;
        }
    }

    return std::nullopt;
}

} // namespace node
} // namespace stakeguard
