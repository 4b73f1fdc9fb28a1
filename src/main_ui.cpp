// Kovak UI - standalone GTK4 process
// Polls the clipboard, owns the history window and the global hotkey binding.
// Commands (toggle/show/hide/clear/quit) arrive on a Unix socket.

#include "kovak/ClipboardManager.hpp"
#include "kovak/ClipboardRenderer.hpp"
#include "kovak/CommandChannel.hpp"
#include "kovak/ConfigParser.hpp"
#include "kovak/HotkeyListener.hpp"
#include "kovak/HyprlandHotkeyBackend.hpp"
#include "kovak/Log.hpp"
#include "kovak/SettingsStore.hpp"
#include "kovak/UnixSocket.hpp"
#include <gtk/gtk.h>
#include <glib-unix.h>
#include <string>

using namespace kovak;

static GMainLoop* g_mainLoop = nullptr;

// ============================================================================
// Command dispatch (UI thread)
// ============================================================================

struct UiContext {
    CommandQueue* queue;
    ClipboardRenderer* renderer;
};

static gboolean drainCommands(gpointer data) {
    auto* ctx = static_cast<UiContext*>(data);
    for (UiCommand command : ctx->queue->drain()) {
        KOVAK_DEBUG("command: {}", toString(command));
        switch (command) {
        case UiCommand::Toggle: ctx->renderer->toggle(); break;
        case UiCommand::Show:   ctx->renderer->show(); break;
        case UiCommand::Hide:   ctx->renderer->hide(); break;
        case UiCommand::Clear:  ctx->renderer->clearHistory(); break;
        case UiCommand::Quit:
            if (g_mainLoop) g_main_loop_quit(g_mainLoop);
            break;
        }
    }
    return G_SOURCE_REMOVE;
}

// ============================================================================
// Signal handler (clean shutdown)
// ============================================================================

static gboolean onSignal(gpointer) {
    if (g_mainLoop) g_main_loop_quit(g_mainLoop);
    return G_SOURCE_CONTINUE;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    // Parse command
    std::string cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) arg = arg.substr(2);
        if (parseUiCommand(arg)) {
            cmd = arg;
        } else {
            g_printerr("usage: kovak-ui [--toggle|--show|--hide|--clear|--quit]\n");
            return 2;
        }
    }

    Config config = loadConfig();

    // If we have a command, try sending to existing instance first
    if (!cmd.empty()) {
        if (sendSocketRequest(config.uiSocketPath, cmd, false)) {
            return 0;  // Sent to running instance, done
        }
        // Nothing to hide, clear or quit without a running instance
        if (cmd != "toggle" && cmd != "show") return 0;
    }

    gtk_init();

    SettingsStore settingsStore(config.settingsFile);
    Settings settings = settingsStore.load();

    GdkDisplay* display = gdk_display_get_default();
    if (!display) {
        KOVAK_ERROR("no display available");
        return 1;
    }

    // Create components
    ClipboardManager manager(config, gdk_display_get_clipboard(display));
    HyprlandHotkeyBackend hotkeyBackend(config.hyprlandSocketPath);
    HotkeyListener hotkeys(hotkeyBackend, settingsStore, settings);
    ClipboardRenderer renderer(config, manager, hotkeys, settings);

    renderer.initialize();
    manager.setRowSink([&renderer](const std::string& row) { renderer.appendRow(row); });

    try {
        hotkeys.registerHotkey(settings.hotkey);
    } catch (const HotkeyError& e) {
        KOVAK_WARN("hotkey '{}' not registered: {}", settings.hotkey, e.what());
    }

    // Listener thread -> queue -> main loop
    CommandQueue queue;
    UiContext ctx{&queue, &renderer};
    queue.setWakeup([&ctx]() { g_idle_add(drainCommands, &ctx); });

    CommandListener listener(queue);
    if (!listener.start(config.uiSocketPath)) {
        KOVAK_WARN("running without command socket");
    }

    manager.startMonitoring();

    renderer.show();

    g_unix_signal_add(SIGINT, onSignal, nullptr);
    g_unix_signal_add(SIGTERM, onSignal, nullptr);

    // Run GLib main loop
    g_mainLoop = g_main_loop_new(nullptr, FALSE);
    g_main_loop_run(g_mainLoop);
    g_main_loop_unref(g_mainLoop);
    g_mainLoop = nullptr;

    // Cleanup: no more commands, then drop the binding
    listener.stop();
    queue.setWakeup(nullptr);
    manager.stopMonitoring();
    hotkeys.unregister();

    return 0;
}
