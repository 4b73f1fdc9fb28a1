#pragma once
// Single Responsibility: hotkey syntax and the binding resource
// Combinations look like "shift+space" or "ctrl+alt+v".

#include <stdexcept>
#include <string>

namespace kovak {

class HotkeyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidHotkeySyntax : public HotkeyError {
public:
    using HotkeyError::HotkeyError;
};

enum HotkeyModifier : unsigned {
    MOD_NONE  = 0,
    MOD_SHIFT = 1u << 0,
    MOD_CTRL  = 1u << 1,
    MOD_ALT   = 1u << 2,
    MOD_SUPER = 1u << 3,
};

struct HotkeyCombo {
    unsigned modifiers = MOD_NONE;
    std::string key;  // keysym name, e.g. "space", "v", "F5"

    bool operator==(const HotkeyCombo&) const = default;

    // "SHIFT,space" (Hyprland bind syntax)
    std::string toHyprland() const;
};

// Throws InvalidHotkeySyntax
HotkeyCombo parseHotkey(const std::string& text);

// OS-level key binding table. Implementations must not call back into the UI.
class HotkeyBackend {
public:
    virtual ~HotkeyBackend() = default;

    // Throws InvalidHotkeySyntax if the combination is rejected,
    // HotkeyError if the binding table is unreachable
    virtual void bind(const HotkeyCombo& combo) = 0;
    virtual void unbind(const HotkeyCombo& combo) = 0;
};

// Owns one live binding; unbinds on destruction
class HotkeyBinding {
public:
    HotkeyBinding(HotkeyBackend& backend, HotkeyCombo combo);
    ~HotkeyBinding();

    HotkeyBinding(const HotkeyBinding&) = delete;
    HotkeyBinding& operator=(const HotkeyBinding&) = delete;

    const HotkeyCombo& combo() const { return m_combo; }

private:
    HotkeyBackend& m_backend;
    HotkeyCombo m_combo;
};

} // namespace kovak
