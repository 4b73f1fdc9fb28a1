// Kovak UI: history list, find bar, settings dialog
// GTK4 layer-shell window, standalone Wayland client

#include "kovak/ClipboardRenderer.hpp"
#include "kovak/ClipboardManager.hpp"
#include "kovak/HotkeyListener.hpp"
#include "kovak/Log.hpp"
#include "kovak/SettingsStore.hpp"
#include <cstdlib>
#include <filesystem>

namespace kovak {

// ── CSS ─────────────────────────────────────────────────────────────────────
static const char* KOVAK_CSS = R"CSS(
.kv-root { background: #ffffff; }

.kv-list row {
  padding: 2px 8px;
  color: #000000;
  background: #ffffff;
}
.kv-list row.match {
  background: #ffff00;
  color: #000000;
}
.kv-row-label {
  font-family: monospace;
}

.kv-find {
  padding: 4px 8px;
  border-bottom: 1px solid #d0d0d0;
}

.kv-buttons {
  padding: 4px;
  border-top: 1px solid #d0d0d0;
}

.kv-settings {
  padding: 12px;
}
)CSS";

static const char* HOTKEY_HINT = "Global hotkey for toggling app visibility (e.g., shift+space)";

// ── Ctor / Dtor ─────────────────────────────────────────────────────────────

ClipboardRenderer::ClipboardRenderer(const Config& config, ClipboardManager& manager,
                                     HotkeyListener& hotkeys, const Settings& settings)
    : m_config(config), m_manager(manager), m_hotkeys(hotkeys), m_settings(settings) {}

ClipboardRenderer::~ClipboardRenderer() {
    if (m_settingsWindow) { gtk_window_destroy(GTK_WINDOW(m_settingsWindow)); m_settingsWindow = nullptr; }
    if (m_window) { gtk_window_destroy(GTK_WINDOW(m_window)); m_window = nullptr; }
}

// ── Initialize ──────────────────────────────────────────────────────────────

void ClipboardRenderer::initialize() {
    GtkCssProvider* css = gtk_css_provider_new();
    gtk_css_provider_load_from_string(css, KOVAK_CSS);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(), GTK_STYLE_PROVIDER(css),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    g_object_unref(css);

    m_window = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(m_window), "Kovak");
    gtk_window_set_default_size(GTK_WINDOW(m_window),
                                m_config.windowWidth, m_config.windowHeight);

    // No anchors: the compositor centers the surface
    gtk_layer_init_for_window(GTK_WINDOW(m_window));
    gtk_layer_set_layer(GTK_WINDOW(m_window), GTK_LAYER_SHELL_LAYER_TOP);
    gtk_layer_set_keyboard_mode(GTK_WINDOW(m_window),
                                GTK_LAYER_SHELL_KEYBOARD_MODE_ON_DEMAND);
    gtk_layer_set_namespace(GTK_WINDOW(m_window), "kovak");

    buildUI();

    // Closing hides; the process keeps recording
    g_signal_connect(m_window, "close-request",
        G_CALLBACK(+[](GtkWindow*, gpointer d) -> gboolean {
            static_cast<ClipboardRenderer*>(d)->hide();
            return TRUE;
        }), this);
}

// ── UI Assembly ─────────────────────────────────────────────────────────────
//
//  ╭──────────────────────────────────────────────╮
//  │ Find: [..................................] ✕ │  (F to open)
//  ├──────────────────────────────────────────────┤
//  │ entry                                        │
//  │                                              │
//  │ entry                                        │
//  │                                              │
//  ├──────────────────────────────────────────────┤
//  │ [Settings]                   [Clear History] │
//  ╰──────────────────────────────────────────────╯

void ClipboardRenderer::buildUI() {
    GtkWidget* root = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_widget_add_css_class(root, "kv-root");

    m_findBar = createFindBar();
    gtk_widget_set_visible(m_findBar, FALSE);
    gtk_box_append(GTK_BOX(root), m_findBar);

    m_scrolled = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(m_scrolled),
                                   GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(m_scrolled, TRUE);
    gtk_widget_set_hexpand(m_scrolled, TRUE);

    m_listBox = gtk_list_box_new();
    gtk_widget_add_css_class(m_listBox, "kv-list");
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(m_listBox), GTK_SELECTION_NONE);
    gtk_list_box_set_activate_on_single_click(GTK_LIST_BOX(m_listBox), TRUE);
    g_signal_connect(m_listBox, "row-activated", G_CALLBACK(onRowActivated), this);

    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(m_scrolled), m_listBox);
    gtk_box_append(GTK_BOX(root), m_scrolled);

    gtk_box_append(GTK_BOX(root), createButtonBar());

    gtk_window_set_child(GTK_WINDOW(m_window), root);

    // Key handler
    GtkEventController* kc = gtk_event_controller_key_new();
    g_signal_connect(kc, "key-pressed", G_CALLBACK(onKeyPress), this);
    gtk_widget_add_controller(m_window, kc);
}

GtkWidget* ClipboardRenderer::createFindBar() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_add_css_class(box, "kv-find");

    gtk_box_append(GTK_BOX(box), gtk_label_new("Find"));

    m_findEntry = gtk_search_entry_new();
    gtk_widget_set_hexpand(m_findEntry, TRUE);
    g_signal_connect(m_findEntry, "search-changed",
        G_CALLBACK(+[](GtkSearchEntry*, gpointer d) {
            auto* s = static_cast<ClipboardRenderer*>(d);
            const char* t = gtk_editable_get_text(GTK_EDITABLE(s->m_findEntry));
            s->applySearch(t ? t : "");
        }), this);
    g_signal_connect(m_findEntry, "stop-search",
        G_CALLBACK(+[](GtkSearchEntry*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->closeFindBar();
        }), this);
    gtk_box_append(GTK_BOX(box), m_findEntry);

    GtkWidget* closeBtn = gtk_button_new_from_icon_name("window-close-symbolic");
    gtk_widget_set_can_focus(closeBtn, FALSE);
    g_signal_connect(closeBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->closeFindBar();
        }), this);
    gtk_box_append(GTK_BOX(box), closeBtn);

    return box;
}

GtkWidget* ClipboardRenderer::createButtonBar() {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_add_css_class(box, "kv-buttons");
    gtk_box_set_homogeneous(GTK_BOX(box), TRUE);

    GtkWidget* settingsBtn = gtk_button_new_with_label("Settings");
    g_signal_connect(settingsBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->openSettings();
        }), this);
    gtk_box_append(GTK_BOX(box), settingsBtn);

    GtkWidget* clearBtn = gtk_button_new_with_label("Clear History");
    g_signal_connect(clearBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->clearHistory();
        }), this);
    gtk_box_append(GTK_BOX(box), clearBtn);

    return box;
}

// ── List management ─────────────────────────────────────────────────────────

void ClipboardRenderer::appendRow(const std::string& text) {
    m_rows.push_back(text);
    if (!m_listBox) return;

    GtkWidget* label = gtk_label_new(text.c_str());
    gtk_label_set_xalign(GTK_LABEL(label), 0);
    gtk_label_set_wrap(GTK_LABEL(label), TRUE);
    gtk_label_set_wrap_mode(GTK_LABEL(label), PANGO_WRAP_WORD_CHAR);
    gtk_widget_add_css_class(label, "kv-row-label");
    gtk_list_box_append(GTK_LIST_BOX(m_listBox), label);

    // Keep highlighting live while the find bar is open
    if (m_findBar && gtk_widget_get_visible(m_findBar)) {
        const char* t = gtk_editable_get_text(GTK_EDITABLE(m_findEntry));
        applySearch(t ? t : "");
    }
}

void ClipboardRenderer::clearHistory() {
    m_manager.clearAll();
    m_rows.clear();
    if (m_listBox) gtk_list_box_remove_all(GTK_LIST_BOX(m_listBox));
}

void ClipboardRenderer::onRowActivated(GtkListBox*, GtkListBoxRow* row, gpointer data) {
    auto* self = static_cast<ClipboardRenderer*>(data);
    int index = gtk_list_box_row_get_index(row);
    if (index < 0 || static_cast<size_t>(index) >= self->m_rows.size()) return;
    self->m_manager.copyToClipboard(self->m_rows[static_cast<size_t>(index)]);
}

// ── Search / highlight ──────────────────────────────────────────────────────

void ClipboardRenderer::openFindBar() {
    if (!m_findBar) return;
    gtk_widget_set_visible(m_findBar, TRUE);
    gtk_widget_grab_focus(m_findEntry);
    const char* t = gtk_editable_get_text(GTK_EDITABLE(m_findEntry));
    if (t && *t) applySearch(t);
}

void ClipboardRenderer::closeFindBar() {
    if (!m_findBar) return;
    gtk_widget_set_visible(m_findBar, FALSE);
    applyMarks(SearchHighlighter::reset(m_rows.size()));
}

void ClipboardRenderer::applySearch(const std::string& query) {
    SearchResult result = SearchHighlighter::search(m_rows, query);
    applyMarks(result);
    if (result.firstMatch) scrollToRow(*result.firstMatch);
}

void ClipboardRenderer::applyMarks(const SearchResult& result) {
    if (!m_listBox) return;
    for (size_t i = 0; i < result.matches.size(); i++) {
        GtkListBoxRow* row = gtk_list_box_get_row_at_index(GTK_LIST_BOX(m_listBox), static_cast<int>(i));
        if (!row) break;
        if (result.matches[i]) gtk_widget_add_css_class(GTK_WIDGET(row), "match");
        else                   gtk_widget_remove_css_class(GTK_WIDGET(row), "match");
    }
}

void ClipboardRenderer::scrollToRow(size_t index) {
    if (!m_scrolled || !m_listBox) return;
    GtkListBoxRow* row = gtk_list_box_get_row_at_index(GTK_LIST_BOX(m_listBox), static_cast<int>(index));
    if (!row) return;

    graphene_rect_t bounds;
    if (!gtk_widget_compute_bounds(GTK_WIDGET(row), m_listBox, &bounds)) return;

    GtkAdjustment* vadj = gtk_scrolled_window_get_vadjustment(GTK_SCROLLED_WINDOW(m_scrolled));
    if (vadj) gtk_adjustment_set_value(vadj, bounds.origin.y);
}

// ── Settings dialog ─────────────────────────────────────────────────────────

GtkWidget* ClipboardRenderer::createSettingsWindow() {
    GtkWidget* window = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(window), "Settings");
    gtk_window_set_default_size(GTK_WINDOW(window), 400, 120);
    gtk_window_set_resizable(GTK_WINDOW(window), FALSE);
    gtk_window_set_hide_on_close(GTK_WINDOW(window), TRUE);

    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(box, "kv-settings");

    GtkWidget* hint = gtk_label_new(HOTKEY_HINT);
    gtk_label_set_xalign(GTK_LABEL(hint), 0);
    gtk_box_append(GTK_BOX(box), hint);

    m_hotkeyEntry = gtk_entry_new();
    g_signal_connect(m_hotkeyEntry, "activate",
        G_CALLBACK(+[](GtkEntry*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->applyHotkey();
        }), this);
    gtk_box_append(GTK_BOX(box), m_hotkeyEntry);

    GtkWidget* applyBtn = gtk_button_new_with_label("Apply");
    g_signal_connect(applyBtn, "clicked",
        G_CALLBACK(+[](GtkButton*, gpointer d) {
            static_cast<ClipboardRenderer*>(d)->applyHotkey();
        }), this);
    gtk_box_append(GTK_BOX(box), applyBtn);

    gtk_window_set_child(GTK_WINDOW(window), box);
    return window;
}

void ClipboardRenderer::openSettings() {
    if (!m_settingsWindow) m_settingsWindow = createSettingsWindow();
    gtk_editable_set_text(GTK_EDITABLE(m_hotkeyEntry), m_settings.hotkey.c_str());
    gtk_window_present(GTK_WINDOW(m_settingsWindow));
}

void ClipboardRenderer::applyHotkey() {
    const char* t = gtk_editable_get_text(GTK_EDITABLE(m_hotkeyEntry));

    HotkeyChange change;
    try {
        change = m_hotkeys.changeHotkey(t ? t : "");
    } catch (const SettingsError& e) {
        KOVAK_ERROR("fatal: {}", e.what());
        std::exit(EXIT_FAILURE);
    } catch (const std::filesystem::filesystem_error& e) {
        KOVAK_ERROR("fatal: {}", e.what());
        std::exit(EXIT_FAILURE);
    }

    switch (change.status) {
    case HotkeyChange::Status::Changed:
        gtk_widget_set_visible(m_settingsWindow, FALSE);
        break;
    case HotkeyChange::Status::Unchanged:
        showMessage(m_settingsWindow, "Info", change.message);
        break;
    case HotkeyChange::Status::Invalid:
    case HotkeyChange::Status::Failed:
        showMessage(m_settingsWindow, "Error", change.message);
        gtk_widget_grab_focus(m_hotkeyEntry);
        break;
    }
}

void ClipboardRenderer::showMessage(GtkWidget* parent, const char* title, const std::string& detail) {
    GtkAlertDialog* dialog = gtk_alert_dialog_new("%s", title);
    gtk_alert_dialog_set_detail(dialog, detail.c_str());
    gtk_alert_dialog_show(dialog, parent ? GTK_WINDOW(parent) : nullptr);
    g_object_unref(dialog);
}

// ── Keyboard handler ────────────────────────────────────────────────────────

gboolean ClipboardRenderer::onKeyPress(GtkEventControllerKey*,
                                       guint keyval, guint,
                                       GdkModifierType state, gpointer data) {
    auto* self = static_cast<ClipboardRenderer*>(data);
    bool findOpen = gtk_widget_get_visible(self->m_findBar);

    if (keyval == GDK_KEY_Escape) {
        if (findOpen) self->closeFindBar();
        else          self->hide();
        return TRUE;
    }

    // Plain F opens find, unless it is being typed into the find entry
    if ((keyval == GDK_KEY_f || keyval == GDK_KEY_F) &&
        !(state & (GDK_CONTROL_MASK | GDK_ALT_MASK | GDK_SUPER_MASK))) {
        GtkWidget* focus = gtk_root_get_focus(GTK_ROOT(self->m_window));
        if (findOpen && focus &&
            (focus == self->m_findEntry || gtk_widget_is_ancestor(focus, self->m_findEntry))) {
            return FALSE;
        }
        self->openFindBar();
        return TRUE;
    }
    return FALSE;
}

// ── Public API ──────────────────────────────────────────────────────────────

void ClipboardRenderer::show() {
    if (m_window && !m_visible) { gtk_window_present(GTK_WINDOW(m_window)); m_visible = true; }
}

void ClipboardRenderer::hide() {
    if (m_window && m_visible) { gtk_widget_set_visible(m_window, FALSE); m_visible = false; }
}

void ClipboardRenderer::toggle() {
    if (!m_window) return;
    if (m_visible) hide(); else show();
}

bool ClipboardRenderer::isVisible() const { return m_visible; }

} // namespace kovak
