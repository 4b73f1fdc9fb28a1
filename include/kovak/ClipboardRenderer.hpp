#pragma once
// GTK4 layer-shell history window, find bar and settings dialog
// Runs on the UI thread only.

#include "Forward.hpp"
#include "Config.hpp"
#include "SearchHighlighter.hpp"
#include <gtk/gtk.h>
#include <gtk4-layer-shell.h>
#include <string>
#include <vector>

namespace kovak {

class ClipboardRenderer {
public:
    ClipboardRenderer(const Config& config, ClipboardManager& manager,
                      HotkeyListener& hotkeys, const Settings& settings);
    ~ClipboardRenderer();

    void initialize();  // Create window + UI (call AFTER gtk_init)
    void show();
    void hide();
    void toggle();
    bool isVisible() const;

    // Presentation rows, fed by the clipboard poller
    void appendRow(const std::string& text);
    void clearHistory();

    void openFindBar();
    void closeFindBar();
    void openSettings();

private:
    const Config& m_config;
    ClipboardManager& m_manager;
    HotkeyListener& m_hotkeys;
    const Settings& m_settings;

    // GTK widgets
    GtkWidget* m_window = nullptr;
    GtkWidget* m_listBox = nullptr;
    GtkWidget* m_scrolled = nullptr;
    GtkWidget* m_findBar = nullptr;
    GtkWidget* m_findEntry = nullptr;
    GtkWidget* m_settingsWindow = nullptr;
    GtkWidget* m_hotkeyEntry = nullptr;

    std::vector<std::string> m_rows;
    bool m_visible = false;

    // UI building
    void buildUI();
    GtkWidget* createFindBar();
    GtkWidget* createButtonBar();
    GtkWidget* createSettingsWindow();

    // Search/highlight
    void applySearch(const std::string& query);
    void applyMarks(const SearchResult& result);
    void scrollToRow(size_t index);

    void applyHotkey();
    void showMessage(GtkWidget* parent, const char* title, const std::string& detail);

    static void onRowActivated(GtkListBox* box, GtkListBoxRow* row, gpointer data);
    static gboolean onKeyPress(GtkEventControllerKey* controller,
                               guint keyval, guint keycode,
                               GdkModifierType state, gpointer data);
};

} // namespace kovak
