#include "kovak/HotkeyListener.hpp"
#include "kovak/Log.hpp"

namespace kovak {

HotkeyListener::HotkeyListener(HotkeyBackend& backend, SettingsStore& store, Settings& settings)
    : m_backend(backend), m_store(store), m_settings(settings) {
}

HotkeyListener::~HotkeyListener() {
    unregister();
}

HotkeyCombo HotkeyListener::probe(const std::string& hotkey) {
    HotkeyCombo combo = parseHotkey(hotkey);
    m_backend.bind(combo);
    m_backend.unbind(combo);
    return combo;
}

void HotkeyListener::registerHotkey(const std::string& hotkey) {
    HotkeyCombo combo = probe(hotkey);

    // Old binding goes first; a fresh binding replaces it
    m_binding.reset();
    m_registered.clear();

    m_binding = std::make_unique<HotkeyBinding>(m_backend, combo);
    m_registered = hotkey;
    KOVAK_LOG("registered hotkey '{}' ({})", hotkey, combo.toHyprland());
}

HotkeyChange HotkeyListener::changeHotkey(const std::string& hotkey) {
    if (hotkey == m_settings.hotkey) {
        return {HotkeyChange::Status::Unchanged,
                "The new hotkey is the same as the current one"};
    }

    HotkeyCombo combo;
    try {
        combo = probe(hotkey);
    } catch (const InvalidHotkeySyntax& e) {
        KOVAK_LOG("rejected hotkey '{}': {}", hotkey, e.what());
        return {HotkeyChange::Status::Invalid, "Invalid hotkey entered"};
    } catch (const HotkeyError& e) {
        KOVAK_WARN("cannot probe hotkey '{}': {}", hotkey, e.what());
        return {HotkeyChange::Status::Failed,
                std::string("Could not register the hotkey: ") + e.what()};
    }

    std::string previous = m_registered;
    m_binding.reset();
    m_registered.clear();

    try {
        m_binding = std::make_unique<HotkeyBinding>(m_backend, combo);
        m_registered = hotkey;
    } catch (const HotkeyError& e) {
        KOVAK_WARN("binding '{}' failed after a good probe: {}", hotkey, e.what());
        if (!previous.empty()) {
            try {
                registerHotkey(previous);
            } catch (const HotkeyError& restoreError) {
                KOVAK_ERROR("could not restore hotkey '{}': {}", previous, restoreError.what());
            }
        }
        return {HotkeyChange::Status::Failed,
                std::string("Could not register the hotkey: ") + e.what()};
    }

    m_settings.hotkey = hotkey;
    m_store.save(m_settings);
    KOVAK_LOG("hotkey changed to '{}'", hotkey);
    return {HotkeyChange::Status::Changed, ""};
}

void HotkeyListener::unregister() {
    m_binding.reset();
    m_registered.clear();
}

} // namespace kovak
