#pragma once
// Single Responsibility: lifecycle of the one global toggle hotkey
// Unregistered -> Registered(hotkey) -> Unregistered

#include "Forward.hpp"
#include "Hotkey.hpp"
#include "SettingsStore.hpp"
#include <memory>
#include <string>

namespace kovak {

struct HotkeyChange {
    enum class Status {
        Changed,    // new binding active and persisted
        Unchanged,  // same as the current hotkey (informational)
        Invalid,    // rejected, previous binding untouched
        Failed,     // binding table unreachable, previous binding restored
    };

    Status status = Status::Unchanged;
    std::string message;
};

class HotkeyListener {
public:
    enum class State { Unregistered, Registered };

    HotkeyListener(HotkeyBackend& backend, SettingsStore& store, Settings& settings);
    ~HotkeyListener();

    // Validates with a bind/unbind probe, then binds for real.
    // Throws InvalidHotkeySyntax or HotkeyError; a failed probe leaves the
    // current binding in place.
    void registerHotkey(const std::string& hotkey);

    // Swaps the binding and persists the new hotkey. Settings write
    // failures propagate.
    HotkeyChange changeHotkey(const std::string& hotkey);

    void unregister();

    State state() const { return m_binding ? State::Registered : State::Unregistered; }
    const std::string& registeredHotkey() const { return m_registered; }

private:
    HotkeyBackend& m_backend;
    SettingsStore& m_store;
    Settings& m_settings;
    std::unique_ptr<HotkeyBinding> m_binding;
    std::string m_registered;

    HotkeyCombo probe(const std::string& hotkey);
};

} // namespace kovak
