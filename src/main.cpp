// Kovak - clipboard history for Hyprland
// Plugin entry point - LIGHTWEIGHT (no GTK, no threads)
// Provides the dispatchers the global hotkey binds to; UI runs as kovak-ui.

#define WLR_USE_UNSTABLE
#include <hyprland/src/plugins/PluginAPI.hpp>

#include "kovak/Globals.hpp"
#include "kovak/IPCHandler.hpp"

using namespace kovak;

inline HANDLE g_pHandle = nullptr;

// ============================================================================
// IPC Command Handler (hyprctl kovak <cmd> [args])
// ============================================================================

static std::string cmdKovak(eHyprCtlOutputFormat, std::string request) {
    std::string cmd = request;
    std::string args;

    // hyprctl passes the full request, including our command name
    if (cmd.rfind("kovak", 0) == 0) {
        cmd = cmd.substr(5);
        while (!cmd.empty() && cmd.front() == ' ') cmd.erase(0, 1);
    }

    size_t spacePos = cmd.find(' ');
    if (spacePos != std::string::npos) {
        args = cmd.substr(spacePos + 1);
        cmd = cmd.substr(0, spacePos);
    }

    if (g_ipcHandler) {
        return g_ipcHandler->handleCommand(cmd.empty() ? "help" : cmd, args);
    }
    return "error: not initialized";
}

// ============================================================================
// Dispatchers (bound by kovak-ui: keyword bind <MODS>,<key>,kovak:toggle)
// ============================================================================

static SDispatchResult dispatchShow(std::string) {
    sendUICommand("show");
    return {.success = true};
}

static SDispatchResult dispatchHide(std::string) {
    sendUICommand("hide");
    return {.success = true};
}

static SDispatchResult dispatchToggle(std::string) {
    sendUICommand("toggle");
    return {.success = true};
}

// ============================================================================
// Plugin Lifecycle
// ============================================================================

APICALL EXPORT std::string PLUGIN_API_VERSION() {
    return HYPRLAND_API_VERSION;
}

APICALL EXPORT PLUGIN_DESCRIPTION_INFO PLUGIN_INIT(HANDLE handle) {
    g_pHandle = handle;
    g_handle = handle;

    initGlobals();

    // Register IPC command
    HyprlandAPI::registerHyprCtlCommand(handle,
        SHyprCtlCommand{"kovak", false, cmdKovak});

    // Register dispatchers
    HyprlandAPI::addDispatcherV2(handle, "kovak:show", dispatchShow);
    HyprlandAPI::addDispatcherV2(handle, "kovak:hide", dispatchHide);
    HyprlandAPI::addDispatcherV2(handle, "kovak:toggle", dispatchToggle);

    HyprlandAPI::addNotification(handle,
        "[Kovak] Loaded successfully!",
        CHyprColor(0.2f, 0.8f, 0.2f, 1.0f),
        5000);

    return {
        "kovak",
        "Clipboard history with a global toggle hotkey",
        "Kovak",
        "0.1.0"
    };
}

APICALL EXPORT void PLUGIN_EXIT() {
    cleanupGlobals();

    HyprlandAPI::addNotification(g_pHandle,
        "[Kovak] Unloaded",
        CHyprColor(0.8f, 0.8f, 0.2f, 1.0f),
        3000);
}
