// System clipboard through GdkClipboard: a GLib timeout polls, async reads
// classify the content, and ClipboardPoller decides what to record.

#include "kovak/ClipboardManager.hpp"
#include "kovak/ClipboardFormats.hpp"
#include "kovak/ImageCodec.hpp"
#include "kovak/Log.hpp"
#include <gio/gio.h>

namespace kovak {

ClipboardManager::ClipboardManager(const Config& config, GdkClipboard* clipboard)
    : m_config(config),
      m_clipboard(GDK_CLIPBOARD(g_object_ref(clipboard))),
      m_cancellable(g_cancellable_new()),
      m_poller(m_history) {
}

ClipboardManager::~ClipboardManager() {
    stopMonitoring();
    // Pending reads complete with G_IO_ERROR_CANCELLED and never touch this
    g_cancellable_cancel(m_cancellable);
    g_object_unref(m_cancellable);
    g_object_unref(m_clipboard);
}

// ============================================================================
// Monitoring
// ============================================================================

void ClipboardManager::startMonitoring() {
    if (m_timerId) return;
    m_timerId = g_timeout_add(static_cast<guint>(m_config.pollIntervalMs), onTick, this);
    KOVAK_DEBUG("polling clipboard every {} ms", m_config.pollIntervalMs);
}

void ClipboardManager::stopMonitoring() {
    if (!m_timerId) return;
    g_source_remove(m_timerId);
    m_timerId = 0;
}

void ClipboardManager::setRowSink(ClipboardPoller::RowSink sink) {
    m_poller.setRowSink(std::move(sink));
}

gboolean ClipboardManager::onTick(gpointer data) {
    static_cast<ClipboardManager*>(data)->poll();
    return G_SOURCE_CONTINUE;
}

void ClipboardManager::poll() {
    // Slow clipboard owners: never stack reads
    if (m_readPending) return;

    switch (classifyFormats(gdk_clipboard_get_formats(m_clipboard))) {
    case ClipboardKind::Image:
        m_readPending = true;
        gdk_clipboard_read_texture_async(m_clipboard, m_cancellable, onTextureRead, this);
        break;
    case ClipboardKind::UrlList:
        m_readPending = true;
        gdk_clipboard_read_value_async(m_clipboard, GDK_TYPE_FILE_LIST, G_PRIORITY_DEFAULT,
                                       m_cancellable, onFileListRead, this);
        break;
    case ClipboardKind::Text:
        m_readPending = true;
        gdk_clipboard_read_text_async(m_clipboard, m_cancellable, onTextRead, this);
        break;
    case ClipboardKind::None:
        break;
    }
}

void ClipboardManager::finishRead(std::optional<ClipboardEntry> snapshot) {
    m_readPending = false;
    PollOutcome outcome = m_poller.observe(std::move(snapshot));
    if (outcome != PollOutcome::Unchanged && outcome != PollOutcome::NoContent) {
        KOVAK_DEBUG("poll: {}", toString(outcome));
    }
}

static bool readCancelled(const GError* error) {
    return error && g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED);
}

// ── Async read completions ──────────────────────────────────────────────────

void ClipboardManager::onTextRead(GObject* source, GAsyncResult* result, gpointer data) {
    g_autoptr(GError) error = nullptr;
    g_autofree char* text = gdk_clipboard_read_text_finish(GDK_CLIPBOARD(source), result, &error);
    if (readCancelled(error)) return;

    auto* self = static_cast<ClipboardManager*>(data);
    if (!text) {
        KOVAK_DEBUG("text read failed: {}", error ? error->message : "no text");
        self->finishRead(std::nullopt);
        return;
    }
    self->finishRead(TextEntry{text});
}

void ClipboardManager::onFileListRead(GObject* source, GAsyncResult* result, gpointer data) {
    g_autoptr(GError) error = nullptr;
    const GValue* value = gdk_clipboard_read_value_finish(GDK_CLIPBOARD(source), result, &error);
    if (readCancelled(error)) return;

    auto* self = static_cast<ClipboardManager*>(data);
    if (!value) {
        KOVAK_DEBUG("file list read failed: {}", error ? error->message : "no value");
        self->finishRead(std::nullopt);
        return;
    }

    auto* fileList = static_cast<GdkFileList*>(g_value_get_boxed(value));
    GSList* files = fileList ? gdk_file_list_get_files(fileList) : nullptr;

    std::vector<std::string> uris;
    for (GSList* l = files; l; l = l->next) {
        g_autofree char* uri = g_file_get_uri(G_FILE(l->data));
        uris.push_back(uri);
    }
    g_slist_free(files);

    std::string display = joinUris(uris);

    if (display.empty()) {
        self->finishRead(std::nullopt);
        return;
    }
    self->finishRead(UrlListEntry{display});
}

void ClipboardManager::onTextureRead(GObject* source, GAsyncResult* result, gpointer data) {
    g_autoptr(GError) error = nullptr;
    g_autoptr(GdkTexture) texture =
        gdk_clipboard_read_texture_finish(GDK_CLIPBOARD(source), result, &error);
    if (readCancelled(error)) return;

    auto* self = static_cast<ClipboardManager*>(data);
    if (!texture) {
        KOVAK_DEBUG("image read failed: {}", error ? error->message : "no texture");
        self->finishRead(std::nullopt);
        return;
    }

    ImageEntry entry = makeImageEntry(texture);
    if (entry.png.empty()) {
        self->finishRead(std::nullopt);
        return;
    }
    self->finishRead(std::move(entry));
}

// ============================================================================
// History
// ============================================================================

void ClipboardManager::clearAll() {
    m_history.clear();
    KOVAK_LOG("history cleared");
}

// ============================================================================
// Restore
// ============================================================================

void ClipboardManager::copyToClipboard(const std::string& rowText) {
    write(resolveRestore(rowText, m_history));
}

void ClipboardManager::setUris(const std::vector<std::string>& uris) {
    GSList* files = nullptr;
    for (const auto& uri : uris) {
        files = g_slist_prepend(files, g_file_new_for_uri(uri.c_str()));
    }
    files = g_slist_reverse(files);

    GdkFileList* list = gdk_file_list_new_from_list(files);
    gdk_clipboard_set(m_clipboard, GDK_TYPE_FILE_LIST, list);

    g_boxed_free(GDK_TYPE_FILE_LIST, list);
    g_slist_free_full(files, g_object_unref);
}

void ClipboardManager::write(const RestorePayload& payload) {
    std::visit(Overloaded{
        [&](const ImagePayload& p) {
            g_autoptr(GdkTexture) texture = decodePng(p.png);
            if (texture) {
                gdk_clipboard_set_texture(m_clipboard, texture);
            } else {
                KOVAK_WARN("stored image could not be restored");
            }
        },
        [&](const ImageFilePayload& p) {
            g_autoptr(GError) error = nullptr;
            g_autoptr(GdkTexture) texture = gdk_texture_new_from_filename(p.path.c_str(), &error);
            if (texture) {
                gdk_clipboard_set_texture(m_clipboard, texture);
                return;
            }
            KOVAK_DEBUG("'{}' is not a loadable image ({}), copying as file",
                        p.path, error ? error->message : "unknown error");
            std::string uri = localPathToUri(p.path);
            if (!uri.empty()) {
                setUris({uri});
            } else {
                gdk_clipboard_set_text(m_clipboard, p.path.c_str());
            }
        },
        [&](const UriListPayload& p) {
            setUris(p.uris);
        },
        [&](const TextPayload& p) {
            gdk_clipboard_set_text(m_clipboard, p.text.c_str());
        },
    }, payload);
}

} // namespace kovak
