#pragma once
// Single Responsibility: key bindings in Hyprland's keybind table
// Bindings dispatch to the plugin's kovak:toggle.

#include "Hotkey.hpp"
#include <optional>
#include <string>

namespace kovak {

class HyprlandHotkeyBackend : public HotkeyBackend {
public:
    explicit HyprlandHotkeyBackend(std::string socketPath);

    void bind(const HotkeyCombo& combo) override;
    void unbind(const HotkeyCombo& combo) override;

private:
    std::string m_socketPath;

    std::string request(const std::string& command);
};

// True when a keyword reply rejects the key or modifiers themselves,
// as opposed to a missing dispatcher or another compositor-side failure
bool isKeySyntaxRejection(const std::string& reply);

// Dispatcher of an existing binding on the same combination that Kovak
// does not own, parsed from the output of the `binds` request
std::optional<std::string> findForeignBind(const std::string& bindsOutput,
                                           const HotkeyCombo& combo);

} // namespace kovak
