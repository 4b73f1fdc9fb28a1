#pragma once
#include <string>

namespace kovak {

// Runtime configuration. Not persisted; see Settings for the user-editable part.
struct Config {
    // Window dimensions
    int windowWidth = 1400;
    int windowHeight = 900;

    // Behavior
    int pollIntervalMs = 1000;

    // Paths
    std::string settingsFile;       // <home>/Kovak/settings.json
    std::string uiSocketPath;       // $XDG_RUNTIME_DIR/kovak-ui.sock
    std::string hyprlandSocketPath; // empty when not running under Hyprland
};

} // namespace kovak
