// STAKEGUARD - Chain and Wallet Query Adapter Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/chain/wallet.h"
#include "stakeguard/util/format.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/threadpool.h"

#include <cctype>
#include <future>
#include <sstream>

namespace stakeguard {
namespace chain {

// ============================================================================
// Output Parsers
// ============================================================================

namespace {

/// Find "<label>\s*<digits/dots>\s*DUSK" in `line`
std::optional<double> ExtractAmount(const std::string& line, const std::string& label) {
    size_t pos = line.find(label);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += label.size();

    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;

    size_t start = pos;
    while (pos < line.size() &&
           (std::isdigit(static_cast<unsigned char>(line[pos])) || line[pos] == '.')) {
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    std::string number = line.substr(start, pos - start);

    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    if (line.compare(pos, 4, "DUSK") != 0) {
        return std::nullopt;
    }

    return util::ParseDecimal(number);
}

/// Token following "<label>\s*-\s*" in `line`
std::optional<std::string> ExtractAddress(const std::string& line, const std::string& label) {
    size_t pos = line.find(label);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += label.size();

    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    if (pos >= line.size() || line[pos] != '-') {
        return std::nullopt;
    }
    ++pos;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;

    size_t start = pos;
    while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    if (pos == start) {
        return std::nullopt;
    }
    return line.substr(start, pos - start);
}

} // namespace

std::optional<StakeInfo> ParseStakeInfo(const std::string& output) {
    std::optional<double> eligible;
    std::optional<double> reclaimable;
    std::optional<double> rewards;

    std::istringstream stream(util::StripAnsi(output));
    std::string line;
    while (std::getline(stream, line)) {
        line = util::Trim(line);
        if (line.find("Eligible stake:") != std::string::npos) {
            eligible = ExtractAmount(line, "Eligible stake:");
        } else if (line.find("Reclaimable slashed stake:") != std::string::npos) {
            reclaimable = ExtractAmount(line, "Reclaimable slashed stake:");
        } else if (line.find("Accumulated rewards is:") != std::string::npos) {
            rewards = ExtractAmount(line, "Accumulated rewards is:");
        }
    }

    if (!eligible || !reclaimable || !rewards) {
        LOG_WARN(util::LogCategory::WALLET) << "Incomplete stake-info values. Could not parse fully.";
        return std::nullopt;
    }

    StakeInfo info;
    info.stakeAmount = *eligible;
    info.reclaimableSlashedStake = *reclaimable;
    info.rewardsAmount = *rewards;
    return info;
}

WalletAddresses ParseProfiles(const std::string& output) {
    WalletAddresses addresses;

    std::istringstream stream(util::StripAnsi(output));
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find("Shielded account") != std::string::npos) {
            if (auto addr = ExtractAddress(line, "Shielded account")) {
                addresses.shieldedAddresses.push_back(*addr);
            }
        } else if (line.find("Public account") != std::string::npos) {
            if (auto addr = ExtractAddress(line, "Public account")) {
                addresses.publicAddresses.push_back(*addr);
            }
        }
    }

    return addresses;
}

std::optional<double> ParseSpendable(const std::string& output) {
    std::string text = util::Trim(util::StripAnsi(output));
    const std::string prefix = "Total:";
    if (text.compare(0, prefix.size(), prefix) == 0) {
        text = text.substr(prefix.size());
    }
    return util::ParseDecimal(text);
}

std::optional<int64_t> ParseInteger(const std::string& output) {
    std::string text = util::Trim(util::StripAnsi(output));
    if (text.empty() || text.size() > 18) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return static_cast<int64_t>(std::stoll(text));
}

// ============================================================================
// WalletAdapter Implementation
// ============================================================================

WalletAdapter::WalletAdapter(exec::ICommandExecutor& executor, util::ThreadPool& pool,
                             const Config& config)
    : executor_(executor), pool_(pool), config_(config) {}

exec::CommandLine WalletAdapter::Base(const std::string& binary) const {
    exec::CommandLine cmd;
    if (config_.useSudo) {
        cmd.Arg("sudo");
    }
    cmd.Arg(binary);
    return cmd;
}

exec::CommandLine WalletAdapter::WalletCommand(const std::vector<std::string>& args) const {
    exec::CommandLine cmd = Base(config_.walletBinary);
    cmd.Arg("--password").SecretArg(config_.password);
    for (const auto& arg : args) {
        cmd.Arg(arg);
    }
    return cmd;
}

exec::CommandLine WalletAdapter::QueryCommand(const std::string& verb) const {
    exec::CommandLine cmd = Base(config_.queryBinary);
    cmd.Arg(verb);
    return cmd;
}

std::optional<int64_t> WalletAdapter::FetchBlockHeight() {
    exec::CommandResult result = executor_.Run(QueryCommand("block-height").Routine());
    if (!result.success) {
        return std::nullopt;
    }
    auto height = ParseInteger(result.output);
    if (!height) {
        LOG_WARN(util::LogCategory::WALLET) << "Unparseable block height: " << result.output;
    }
    return height;
}

std::optional<int64_t> WalletAdapter::FetchPeerCount() {
    exec::CommandResult result = executor_.Run(QueryCommand("peers").Routine());
    if (!result.success) {
        return std::nullopt;
    }
    auto peers = ParseInteger(result.output);
    if (!peers) {
        LOG_WARN(util::LogCategory::WALLET) << "Unparseable peer count: " << result.output;
    }
    return peers;
}

std::optional<StakeInfo> WalletAdapter::FetchStakeInfo() {
    exec::CommandResult result = executor_.Run(WalletCommand({"stake-info"}).Routine());
    if (!result.success || result.output.empty()) {
        return std::nullopt;
    }
    return ParseStakeInfo(result.output);
}

std::optional<WalletAddresses> WalletAdapter::FetchAddresses() {
    exec::CommandResult result = executor_.Run(WalletCommand({"profiles"}).Routine());
    if (!result.success || result.output.empty()) {
        return std::nullopt;
    }
    return ParseProfiles(result.output);
}

std::optional<double> WalletAdapter::FetchSpendableBalance(const std::string& address) {
    exec::CommandResult result =
        executor_.Run(WalletCommand({"balance", "--spendable", "--address", address}).Routine());
    if (!result.success || result.output.empty()) {
        return std::nullopt;
    }
    return ParseSpendable(result.output);
}

std::optional<Balances> WalletAdapter::FetchBalances() {
    auto addresses = FetchAddresses();
    if (!addresses) {
        return std::nullopt;
    }

    auto launch = [this](const std::string& address) {
        try {
            return pool_.Submit([this, address]() {
                return FetchSpendableBalance(address).value_or(0.0);
            });
        } catch (const std::exception& e) {
            // Pool saturated or stopping: query on the calling thread
            LOG_DEBUG(util::LogCategory::WALLET) << "Balance query not queued (" << e.what()
                                                 << "), running inline";
            std::promise<double> direct;
            direct.set_value(FetchSpendableBalance(address).value_or(0.0));
            return direct.get_future();
        }
    };

    std::vector<std::future<double>> publicResults;
    std::vector<std::future<double>> shieldedResults;
    for (const auto& addr : addresses->publicAddresses) {
        publicResults.push_back(launch(addr));
    }
    for (const auto& addr : addresses->shieldedAddresses) {
        shieldedResults.push_back(launch(addr));
    }

    Balances balances;
    for (auto& f : publicResults) {
        balances.publicTotal += f.get();
    }
    for (auto& f : shieldedResults) {
        balances.shieldedTotal += f.get();
    }
    return balances;
}

exec::CommandResult WalletAdapter::Withdraw() {
    return executor_.Run(WalletCommand({"withdraw"}));
}

exec::CommandResult WalletAdapter::Unstake() {
    return executor_.Run(WalletCommand({"unstake"}));
}

exec::CommandResult WalletAdapter::Stake(double amount) {
    return executor_.Run(WalletCommand({"stake", "--amt", util::FormatAmountArg(amount)}));
}

} // namespace chain
} // namespace stakeguard
