#pragma once
// Single Responsibility: system clipboard access (poll, classify, restore)

#include "Forward.hpp"
#include "ClipboardPoller.hpp"
#include "Config.hpp"
#include "HistoryStore.hpp"
#include "Restore.hpp"
#include <gdk/gdk.h>
#include <functional>
#include <optional>
#include <string>

namespace kovak {

class ClipboardManager {
public:
    ClipboardManager(const Config& config, GdkClipboard* clipboard);
    ~ClipboardManager();

    ClipboardManager(const ClipboardManager&) = delete;
    ClipboardManager& operator=(const ClipboardManager&) = delete;

    // Monitoring
    void startMonitoring();
    void stopMonitoring();
    void setRowSink(ClipboardPoller::RowSink sink);

    // History
    const HistoryStore& history() const { return m_history; }
    void clearAll();

    // Restore a history row onto the clipboard
    void copyToClipboard(const std::string& rowText);
    void write(const RestorePayload& payload);

private:
    const Config& m_config;
    GdkClipboard* m_clipboard;
    GCancellable* m_cancellable = nullptr;
    guint m_timerId = 0;
    bool m_readPending = false;

    HistoryStore m_history;
    ClipboardPoller m_poller;

    static gboolean onTick(gpointer data);
    void poll();
    void finishRead(std::optional<ClipboardEntry> snapshot);

    static void onTextRead(GObject* source, GAsyncResult* result, gpointer data);
    static void onFileListRead(GObject* source, GAsyncResult* result, gpointer data);
    static void onTextureRead(GObject* source, GAsyncResult* result, gpointer data);

    void setUris(const std::vector<std::string>& uris);
};

} // namespace kovak
