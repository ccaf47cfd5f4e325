#pragma once

#include "simulation_controller.hpp"
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// ============================================================
//  Command  –  discrete input mapped onto the controller
// ============================================================

enum class Command {
    PauseToggle,
    Restart,
    Quit,
    GravityToggle,
    ZoomIn,
    ZoomOut,
};

inline constexpr double kZoomInFactor  = 1.05;
inline constexpr double kZoomOutFactor = 0.95;

inline constexpr std::array<std::pair<std::string_view, Command>, 6> kCommandNames{{
    { "pause_toggle",   Command::PauseToggle   },
    { "restart",        Command::Restart       },
    { "quit",           Command::Quit          },
    { "gravity_toggle", Command::GravityToggle },
    { "zoom_in",        Command::ZoomIn        },
    { "zoom_out",       Command::ZoomOut       },
}};

/// Looks up a command by its wire name; unknown names yield nullopt.
[[nodiscard]] constexpr std::optional<Command> parseCommand(std::string_view name) noexcept {
    for (const auto& [n, c] : kCommandNames)
        if (n == name) return c;
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view commandName(Command c) noexcept {
    for (const auto& [n, cmd] : kCommandNames)
        if (cmd == c) return n;
    return "unknown";
}

/**
 * Applies one command to the controller.
 * @return false when the command asks the frame loop to stop (Quit).
 */
inline bool dispatch(SimulationController& sim, Command c) {
    switch (c) {
        case Command::PauseToggle:   sim.togglePause();               break;
        case Command::Restart:       sim.restart();                   break;
        case Command::GravityToggle: sim.toggleGravity();             break;
        case Command::ZoomIn:        sim.adjustZoom(kZoomInFactor);   break;
        case Command::ZoomOut:       sim.adjustZoom(kZoomOutFactor);  break;
        case Command::Quit:          return false;
    }
    return true;
}

/// Name-based overload; unrecognised names are ignored.
inline bool dispatch(SimulationController& sim, std::string_view name) {
    if (auto c = parseCommand(name))
        return dispatch(sim, *c);
    return true;
}
