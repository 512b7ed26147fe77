// STAKEGUARD - Chain and Wallet Query Adapter
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Wraps the wallet and chain-query command-line tools. Every query returns
// std::nullopt when the command fails or its output cannot be parsed.

#ifndef STAKEGUARD_CHAIN_WALLET_H
#define STAKEGUARD_CHAIN_WALLET_H

#include "stakeguard/exec/command.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakeguard {

namespace util {
class ThreadPool;
}

namespace chain {

// ============================================================================
// Value Types
// ============================================================================

/// Stake position as reported by `stake-info`
struct StakeInfo {
    double stakeAmount{0.0};
    double reclaimableSlashedStake{0.0};
    double rewardsAmount{0.0};

    bool operator==(const StakeInfo& other) const {
        return stakeAmount == other.stakeAmount &&
               reclaimableSlashedStake == other.reclaimableSlashedStake &&
               rewardsAmount == other.rewardsAmount;
    }
    bool operator!=(const StakeInfo& other) const { return !(*this == other); }
};

/// Spendable totals per account type
struct Balances {
    double publicTotal{0.0};
    double shieldedTotal{0.0};

    double Total() const { return publicTotal + shieldedTotal; }

    bool operator==(const Balances& other) const {
        return publicTotal == other.publicTotal && shieldedTotal == other.shieldedTotal;
    }
    bool operator!=(const Balances& other) const { return !(*this == other); }
};

/// Wallet addresses from `profiles`
struct WalletAddresses {
    std::vector<std::string> publicAddresses;
    std::vector<std::string> shieldedAddresses;
};

// ============================================================================
// Output Parsers
// ============================================================================

/**
 * Parse `stake-info` output. The three fields
 *   Eligible stake: <n> DUSK
 *   Reclaimable slashed stake: <n> DUSK
 *   Accumulated rewards is: <n> DUSK
 * are all required; if any is missing the result is nullopt.
 */
std::optional<StakeInfo> ParseStakeInfo(const std::string& output);

/// Parse `profiles` output ("Public account - <addr>", "Shielded account - <addr>")
WalletAddresses ParseProfiles(const std::string& output);

/// Parse `balance --spendable` output ("Total: <n>" or a bare number)
std::optional<double> ParseSpendable(const std::string& output);

/// Parse a single non-negative integer (block height, peer count)
std::optional<int64_t> ParseInteger(const std::string& output);

// ============================================================================
// Wallet Adapter
// ============================================================================

class WalletAdapter {
public:
    struct Config {
        std::string walletBinary{"rusk-wallet"};
        std::string queryBinary{"ruskquery"};
        std::string password;
        bool useSudo{false};
    };

    /**
     * @param executor Runs the external commands
     * @param pool Workers for the per-address balance fan-out; must outlive
     *             the adapter
     */
    WalletAdapter(exec::ICommandExecutor& executor, util::ThreadPool& pool,
                  const Config& config);

    // Queries

    std::optional<int64_t> FetchBlockHeight();
    std::optional<int64_t> FetchPeerCount();
    std::optional<StakeInfo> FetchStakeInfo();
    std::optional<WalletAddresses> FetchAddresses();
    std::optional<double> FetchSpendableBalance(const std::string& address);

    /**
     * Sum spendable balances over every address, one concurrent query per
     * address. A failed address contributes 0; nullopt only if the address
     * list itself could not be fetched.
     */
    std::optional<Balances> FetchBalances();

    // Actions

    exec::CommandResult Withdraw();
    exec::CommandResult Unstake();
    exec::CommandResult Stake(double amount);

    /// Command lines as they will be executed (password as a secret argument)
    exec::CommandLine WalletCommand(const std::vector<std::string>& args) const;
    exec::CommandLine QueryCommand(const std::string& verb) const;

private:
    exec::CommandLine Base(const std::string& binary) const;

    exec::ICommandExecutor& executor_;
    util::ThreadPool& pool_;
    Config config_;
};

} // namespace chain
} // namespace stakeguard

#endif // STAKEGUARD_CHAIN_WALLET_H
