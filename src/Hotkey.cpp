#include "kovak/Hotkey.hpp"
#include "kovak/Log.hpp"
#include <gdk/gdk.h>
#include <unordered_map>
#include <vector>

namespace kovak {

// ── Token tables ────────────────────────────────────────────────────────────

static const std::unordered_map<std::string, unsigned> MODIFIER_NAMES = {
    {"shift", MOD_SHIFT},
    {"ctrl", MOD_CTRL}, {"control", MOD_CTRL},
    {"alt", MOD_ALT}, {"option", MOD_ALT},
    {"super", MOD_SUPER}, {"win", MOD_SUPER}, {"windows", MOD_SUPER},
    {"cmd", MOD_SUPER}, {"command", MOD_SUPER}, {"meta", MOD_SUPER},
};

// Friendly names that differ from the keysym name
static const std::unordered_map<std::string, std::string> KEY_ALIASES = {
    {"enter", "Return"}, {"return", "Return"},
    {"esc", "Escape"}, {"escape", "Escape"},
    {"tab", "Tab"},
    {"backspace", "BackSpace"},
    {"del", "Delete"}, {"delete", "Delete"},
    {"ins", "Insert"}, {"insert", "Insert"},
    {"home", "Home"}, {"end", "End"},
    {"pgup", "Prior"}, {"pageup", "Prior"}, {"page up", "Prior"},
    {"pgdn", "Next"}, {"pagedown", "Next"}, {"page down", "Next"},
    {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
    {"capslock", "Caps_Lock"}, {"caps lock", "Caps_Lock"},
    {"print", "Print"}, {"printscreen", "Print"}, {"print screen", "Print"},
    {"pause", "Pause"}, {"menu", "Menu"},
};

static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

static std::string toLower(const std::string& s) {
    g_autofree gchar* lower = g_ascii_strdown(s.c_str(), static_cast<gssize>(s.size()));
    return lower;
}

static std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        parts.push_back(text.substr(start, pos == std::string::npos ? std::string::npos
                                                                    : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

// Returns the canonical keysym name, or "" when the token names no key
static std::string resolveKey(const std::string& token) {
    std::string lower = toLower(token);

    auto alias = KEY_ALIASES.find(lower);
    if (alias != KEY_ALIASES.end()) return alias->second;

    guint keyval = GDK_KEY_VoidSymbol;

    // Single character: "a", "1", ","
    if (g_utf8_validate(token.c_str(), static_cast<gssize>(token.size()), nullptr) &&
        g_utf8_strlen(token.c_str(), static_cast<gssize>(token.size())) == 1) {
        gunichar ch = g_unichar_tolower(g_utf8_get_char(token.c_str()));
        keyval = gdk_unicode_to_keyval(ch);
    }

    if (keyval == GDK_KEY_VoidSymbol) keyval = gdk_keyval_from_name(token.c_str());
    if (keyval == GDK_KEY_VoidSymbol) keyval = gdk_keyval_from_name(lower.c_str());

    // "f5" -> "F5"
    if (keyval == GDK_KEY_VoidSymbol && lower.size() > 1 && lower[0] == 'f') {
        std::string fkey = "F" + lower.substr(1);
        keyval = gdk_keyval_from_name(fkey.c_str());
    }

    if (keyval == GDK_KEY_VoidSymbol || keyval == 0) return "";

    // Unicode fallback keysyms (0x01000000 | codepoint) have no portable name
    const char* name = gdk_keyval_name(keyval);
    if (!name || g_str_has_prefix(name, "0x")) return "";
    return name;
}

// ── Parsing ─────────────────────────────────────────────────────────────────

HotkeyCombo parseHotkey(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) throw InvalidHotkeySyntax("empty hotkey");

    HotkeyCombo combo;
    for (const auto& rawToken : split(input, '+')) {
        std::string token = trim(rawToken);
        if (token.empty()) {
            throw InvalidHotkeySyntax("empty key in '" + text + "'");
        }

        auto mod = MODIFIER_NAMES.find(toLower(token));
        if (mod != MODIFIER_NAMES.end()) {
            combo.modifiers |= mod->second;
            continue;
        }

        if (!combo.key.empty()) {
            throw InvalidHotkeySyntax("more than one key in '" + text + "'");
        }

        combo.key = resolveKey(token);
        if (combo.key.empty()) {
            throw InvalidHotkeySyntax("unknown key '" + token + "'");
        }
    }

    if (combo.key.empty()) {
        throw InvalidHotkeySyntax("no key in '" + text + "'");
    }
    return combo;
}

std::string HotkeyCombo::toHyprland() const {
    std::string mods;
    auto add = [&](unsigned bit, const char* name) {
        if (!(modifiers & bit)) return;
        if (!mods.empty()) mods += '_';
        mods += name;
    };
    add(MOD_SUPER, "SUPER");
    add(MOD_CTRL, "CTRL");
    add(MOD_ALT, "ALT");
    add(MOD_SHIFT, "SHIFT");
    return mods + "," + key;
}

// ── HotkeyBinding ───────────────────────────────────────────────────────────

HotkeyBinding::HotkeyBinding(HotkeyBackend& backend, HotkeyCombo combo)
    : m_backend(backend), m_combo(std::move(combo)) {
    m_backend.bind(m_combo);
}

HotkeyBinding::~HotkeyBinding() {
    try {
        m_backend.unbind(m_combo);
    } catch (const HotkeyError& e) {
        KOVAK_WARN("failed to unbind {}: {}", m_combo.toHyprland(), e.what());
    }
}

} // namespace kovak
