#pragma once
// Single Responsibility: runtime configuration and well-known paths

#include "Config.hpp"
#include <string>

namespace kovak {

// Build runtime config from defaults and the environment
Config loadConfig();

// <home>/Kovak/settings.json
std::string getSettingsPath();

// $XDG_RUNTIME_DIR/kovak-ui.sock, or /tmp/kovak-ui.sock
std::string getUiSocketPath();

// $XDG_RUNTIME_DIR/hypr/$HYPRLAND_INSTANCE_SIGNATURE/.socket.sock, or "" outside Hyprland
std::string getHyprlandSocketPath();

} // namespace kovak
