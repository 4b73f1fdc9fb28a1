// Single Responsibility: runtime configuration and well-known paths

#include "kovak/ConfigParser.hpp"
#include <glib.h>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace kovak {

static std::string homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    // GLib falls back to the passwd entry
    return g_get_home_dir();
}

static std::string runtimeDir() {
    const char* xdgRuntime = std::getenv("XDG_RUNTIME_DIR");
    if (xdgRuntime && *xdgRuntime) return xdgRuntime;
    return "/tmp";
}

std::string getSettingsPath() {
    return (fs::path(homeDir()) / "Kovak" / "settings.json").string();
}

std::string getUiSocketPath() {
    return runtimeDir() + "/kovak-ui.sock";
}

std::string getHyprlandSocketPath() {
    const char* signature = std::getenv("HYPRLAND_INSTANCE_SIGNATURE");
    if (!signature || !*signature) return "";

    // Hyprland >= 0.40 keeps its sockets under $XDG_RUNTIME_DIR/hypr,
    // older releases under /tmp/hypr
    fs::path current = fs::path(runtimeDir()) / "hypr" / signature / ".socket.sock";
    fs::path legacy = fs::path("/tmp/hypr") / signature / ".socket.sock";

    std::error_code ec;
    if (!fs::exists(current, ec) && fs::exists(legacy, ec)) {
        return legacy.string();
    }
    return current.string();
}

Config loadConfig() {
    Config config;
    config.settingsFile = getSettingsPath();
    config.uiSocketPath = getUiSocketPath();
    config.hyprlandSocketPath = getHyprlandSocketPath();
    return config;
}

} // namespace kovak
