// STAKEGUARD - Status Presentation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Read-only renderers for the shared state: a terminal status block and a
// tmux status bar. Renderers receive a snapshot and never touch the store.

#ifndef STAKEGUARD_UI_STATUS_VIEW_H
#define STAKEGUARD_UI_STATUS_VIEW_H

#include "stakeguard/exec/command.h"
#include "stakeguard/node/state.h"

#include <atomic>
#include <iosfwd>
#include <string>

namespace stakeguard {
namespace ui {

// ============================================================================
// ANSI Colours
// ============================================================================

namespace Color {
    constexpr const char* DEFAULT = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* LIGHT_RED = "\033[91m";
    constexpr const char* LIGHT_GREEN = "\033[92m";
    constexpr const char* LIGHT_BLUE = "\033[94m";
    constexpr const char* LIGHT_WHITE = "\033[97m";
}

/// Countdown colour: red under 1h, yellow under 2h, green under 3h, else white
const char* CountdownColor(int64_t remainingSeconds);

/// Peer colour: green above 40, yellow above 16, else red
const char* PeerColor(int64_t peerCount);

// ============================================================================
// View Interface
// ============================================================================

class IStatusView {
public:
    virtual ~IStatusView() = default;

    virtual void Render(const node::StateSnapshot& snapshot) = 0;
};

// ============================================================================
// Terminal View
// ============================================================================

/// Multi-line status block, with ANSI colours when `useColors` is set
std::string BuildTerminalStatus(const node::StateSnapshot& snapshot, bool useColors);

class TerminalView : public IStatusView {
public:
    TerminalView(std::ostream& out, bool useColors);

    /// Redraws the status log and block in place
    void Render(const node::StateSnapshot& snapshot) override;

private:
    std::ostream& out_;
    bool useColors_;
};

// ============================================================================
// tmux Status Bar
// ============================================================================

/// Per-field toggles for the status bar
struct StatusBarFields {
    bool showCurrentBlock{true};
    bool showStaked{true};
    bool showPublic{true};
    bool showShielded{true};
    bool showTotal{true};
    bool showRewards{true};
    bool showReclaimable{true};
    bool showPrice{true};
    bool showTimer{true};
    bool showTriggerTime{true};
    bool showPeerCount{true};
};

/// Single-line status text with ANSI codes stripped
std::string BuildTmuxStatus(const node::StateSnapshot& snapshot, const StatusBarFields& fields);

/**
 * Pushes the status line to tmux with `tmux set-option -g status-left`.
 * The first failed call disables the view for the rest of the process.
 */
class TmuxStatusView : public IStatusView {
public:
    TmuxStatusView(exec::ICommandExecutor& executor, const StatusBarFields& fields);

    void Render(const node::StateSnapshot& snapshot) override;

    bool IsEnabled() const { return enabled_.load(); }

private:
    exec::ICommandExecutor& executor_;
    StatusBarFields fields_;
    std::atomic<bool> enabled_{true};
};

} // namespace ui
} // namespace stakeguard

#endif // STAKEGUARD_UI_STATUS_VIEW_H
