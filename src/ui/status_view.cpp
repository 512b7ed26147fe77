// STAKEGUARD - Status Presentation Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/ui/status_view.h"
#include "stakeguard/util/format.h"
#include "stakeguard/util/logging.h"
#include "stakeguard/util/time.h"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace stakeguard {
namespace ui {

using util::FormatAmount;

const char* CountdownColor(int64_t remainingSeconds) {
    if (remainingSeconds <= util::SECONDS_PER_HOUR) return Color::RED;
    if (remainingSeconds <= 2 * util::SECONDS_PER_HOUR) return Color::YELLOW;
    if (remainingSeconds <= 3 * util::SECONDS_PER_HOUR) return Color::GREEN;
    return Color::LIGHT_WHITE;
}

const char* PeerColor(int64_t peerCount) {
    if (peerCount > 40) return Color::LIGHT_GREEN;
    if (peerCount > 16) return Color::YELLOW;
    return Color::RED;
}

namespace {

/// "(+1.23% 24h)" coloured by sign, or "(unknown 24h)"
std::string ChangeText(const node::SharedState& state, bool useColors) {
    if (!state.market) {
        return "(unknown 24h)";
    }

    double change = state.market->change24hPct;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "(";
    if (change > 0) {
        ss << (useColors ? Color::GREEN : "") << "+" << change << "%";
    } else if (change < 0) {
        ss << (useColors ? Color::RED : "") << change << "%";
    } else {
        ss << change << "%";
    }
    ss << (useColors ? Color::DEFAULT : "") << " 24h)";
    return ss.str();
}

std::string PriceText(const node::SharedState& state) {
    return state.market ? FormatAmount(state.market->price, 3) : std::string("unknown");
}

} // namespace

// ============================================================================
// Terminal View
// ============================================================================

std::string BuildTerminalStatus(const node::StateSnapshot& snapshot, bool useColors) {
    const node::SharedState& s = snapshot.state;
    const chain::StakeInfo& st = s.stakeInfo;
    const chain::Balances& b = s.balances;
    double price = s.Price();

    auto c = [useColors](const char* code) { return useColors ? code : ""; };
    auto fiat = [price](double amount) { return "$" + FormatAmount(amount * price, 2); };

    const char* timerColor = CountdownColor(s.remainingSeconds);
    std::string now = util::FormatTime(util::SystemClock::now(), "%H:%M:%S");

    std::ostringstream ss;
    ss << " " << c(Color::LIGHT_WHITE) << "=======" << c(Color::DEFAULT) << " " << now
       << " Block: " << c(Color::LIGHT_BLUE) << "#" << s.blockHeight << " " << c(Color::DEFAULT)
       << "Peers: " << c(PeerColor(s.peerCount)) << s.peerCount << c(Color::DEFAULT) << " "
       << c(Color::LIGHT_WHITE) << "=======" << c(Color::DEFAULT) << "\n";
    ss << "    " << c(Color::CYAN) << "Last Action" << c(Color::DEFAULT) << "   | "
       << c(Color::CYAN) << s.lastActionTaken << c(Color::DEFAULT) << "\n";
    ss << "    " << c(Color::LIGHT_GREEN) << "Next Check    " << c(Color::DEFAULT) << "| "
       << c(timerColor) << util::FormatHMS(s.remainingSeconds) << c(Color::DEFAULT)
       << " (" << s.completionTimeLabel << ")\n";
    ss << "                  |\n";
    ss << "    " << c(Color::LIGHT_WHITE) << "Balance" << c(Color::DEFAULT) << "       | "
       << "  @ $" << PriceText(s) << " USD " << ChangeText(s, useColors) << "\n";
    ss << "      ├─ " << c(Color::YELLOW) << "Public   " << c(Color::DEFAULT) << "| "
       << FormatAmount(b.publicTotal) << " (" << fiat(b.publicTotal) << ")\n";
    ss << "      └─ " << c(Color::BLUE) << "Shielded " << c(Color::DEFAULT) << "| "
       << FormatAmount(b.shieldedTotal) << " (" << fiat(b.shieldedTotal) << ")\n";
    ss << "            Total | " << FormatAmount(b.Total()) << " DUSK ("
       << fiat(b.Total()) << ")\n";
    ss << "                  |\n";
    ss << "    " << c(Color::LIGHT_WHITE) << "Staked" << c(Color::DEFAULT) << "        | "
       << FormatAmount(st.stakeAmount) << " (" << fiat(st.stakeAmount) << ")\n";
    ss << "    " << c(Color::YELLOW) << "Rewards" << c(Color::DEFAULT) << "       | "
       << FormatAmount(st.rewardsAmount) << " (" << fiat(st.rewardsAmount) << ")\n";
    ss << "    " << c(Color::LIGHT_RED) << "Reclaimable" << c(Color::DEFAULT) << "   | "
       << FormatAmount(st.reclaimableSlashedStake) << " ("
       << fiat(st.reclaimableSlashedStake) << ")\n";
    ss << " " << std::string(47, '=') << "\n";
    return ss.str();
}

TerminalView::TerminalView(std::ostream& out, bool useColors)
    : out_(out), useColors_(useColors) {}

void TerminalView::Render(const node::StateSnapshot& snapshot) {
    if (useColors_) {
        // Clear screen, cursor home
        out_ << "\033[2J\033[H";
    }
    for (const auto& entry : snapshot.logEntries) {
        out_ << entry << "\n";
    }
    out_ << BuildTerminalStatus(snapshot, useColors_);
    out_.flush();
}

// ============================================================================
// tmux Status Bar
// ============================================================================

std::string BuildTmuxStatus(const node::StateSnapshot& snapshot, const StatusBarFields& fields) {
    const node::SharedState& s = snapshot.state;
    const chain::StakeInfo& st = s.stakeInfo;
    const chain::Balances& b = s.balances;

    std::string blk = fields.showCurrentBlock ? "Blk: #" + std::to_string(s.blockHeight) + " | " : "";
    std::string stk = fields.showStaked ? "Stk: " + FormatAmount(st.stakeAmount) + " | " : "";
    std::string rcl = fields.showReclaimable
                          ? "Rcl: " + FormatAmount(st.reclaimableSlashedStake) + " | " : "";
    std::string rwd = fields.showRewards ? "Rwd: " + FormatAmount(st.rewardsAmount) + " | " : "";
    std::string pub = fields.showPublic ? "P:" + FormatAmount(b.publicTotal) : "";
    std::string shd = fields.showShielded ? "S:" + FormatAmount(b.shieldedTotal) : "";

    std::string bal;
    std::string splitter = " | ";
    if (fields.showTotal && (fields.showPublic || fields.showShielded)) {
        bal = "Bal: ";
    }
    if (!fields.showPublic && !fields.showShielded) {
        splitter.clear();
    }
    std::string spacer = (fields.showPublic && fields.showShielded) ? "  " : "";

    std::string usd = fields.showPrice
                          ? "$USD: " + PriceText(s) + " " + ChangeText(s, false) + " | " : "";
    std::string timer = fields.showTimer ? "Next: " + util::FormatHMS(s.remainingSeconds) + " " : "";
    std::string done = fields.showTriggerTime ? "(" + s.completionTimeLabel + ") " : "";
    std::string peers = fields.showPeerCount ? "Peers: " + std::to_string(s.peerCount) : "";

    std::string status = "> " + blk + stk + rcl + rwd + bal + pub + spacer + shd + splitter +
                         usd + timer + done + peers;
    return util::Trim(util::StripAnsi(status));
}

TmuxStatusView::TmuxStatusView(exec::ICommandExecutor& executor, const StatusBarFields& fields)
    : executor_(executor), fields_(fields) {}

void TmuxStatusView::Render(const node::StateSnapshot& snapshot) {
    if (!enabled_.load()) {
        return;
    }

    exec::CommandLine cmd({"tmux", "set-option", "-g", "status-left",
                           BuildTmuxStatus(snapshot, fields_)});
    cmd.Routine();
    exec::CommandResult result = executor_.Run(cmd);
    if (!result.success) {
        LOG_ERROR(util::LogCategory::DISPLAY) << "Failed to update tmux status bar. Is tmux running?";
        enabled_.store(false);
    }
}

} // namespace ui
} // namespace stakeguard
