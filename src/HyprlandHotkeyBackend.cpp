// Hyprland request socket: one plain-text command per connection,
// replies "ok" or an error description

#include "kovak/HyprlandHotkeyBackend.hpp"
#include "kovak/Log.hpp"
#include "kovak/UnixSocket.hpp"
#include <glib.h>
#include <sstream>

namespace kovak {

static const char* TOGGLE_DISPATCHER = "kovak:toggle";

bool isKeySyntaxRejection(const std::string& reply) {
    g_autofree gchar* lower = g_ascii_strdown(reply.c_str(), static_cast<gssize>(reply.size()));
    std::string text = lower;
    // "Invalid mod, requested mod ...", "Invalid key ...", "... keysym ..."
    return text.find("invalid mod") != std::string::npos ||
           text.find("invalid key") != std::string::npos ||
           text.find("keysym") != std::string::npos;
}

// Hyprland modmask bits
static unsigned toModmask(unsigned modifiers) {
    unsigned mask = 0;
    if (modifiers & MOD_SHIFT) mask |= 1u;
    if (modifiers & MOD_CTRL)  mask |= 4u;
    if (modifiers & MOD_ALT)   mask |= 8u;
    if (modifiers & MOD_SUPER) mask |= 64u;
    return mask;
}

static std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

// `binds` output: one block per binding, a "bind..." header line followed by
// indented "field: value" lines
std::optional<std::string> findForeignBind(const std::string& bindsOutput,
                                           const HotkeyCombo& combo) {
    struct Block {
        std::string modmask, key, dispatcher;
    };
    const std::string wantedMask = std::to_string(toModmask(combo.modifiers));

    auto matches = [&](const Block& b) {
        return !b.key.empty() && b.modmask == wantedMask &&
               g_ascii_strcasecmp(b.key.c_str(), combo.key.c_str()) == 0 &&
               b.dispatcher != TOGGLE_DISPATCHER;
    };

    std::istringstream in(bindsOutput);
    std::string line;
    std::optional<Block> current;
    while (std::getline(in, line)) {
        std::string text = trim(line);
        if (text.rfind("bind", 0) == 0 && text.find(':') == std::string::npos) {
            if (current && matches(*current)) return current->dispatcher;
            current = Block{};
            continue;
        }
        if (!current) continue;

        size_t colon = text.find(':');
        if (colon == std::string::npos) continue;
        std::string field = text.substr(0, colon);
        std::string value = trim(text.substr(colon + 1));
        if (field == "modmask")         current->modmask = value;
        else if (field == "key")        current->key = value;
        else if (field == "dispatcher") current->dispatcher = value;
    }
    if (current && matches(*current)) return current->dispatcher;
    return std::nullopt;
}

HyprlandHotkeyBackend::HyprlandHotkeyBackend(std::string socketPath)
    : m_socketPath(std::move(socketPath)) {
}

std::string HyprlandHotkeyBackend::request(const std::string& command) {
    if (m_socketPath.empty()) {
        throw HotkeyError("not running under Hyprland (HYPRLAND_INSTANCE_SIGNATURE unset)");
    }

    auto reply = sendSocketRequest(m_socketPath, command, true);
    if (!reply) {
        throw HotkeyError("cannot reach Hyprland at " + m_socketPath);
    }

    std::string response = *reply;
    while (!response.empty() && (response.back() == '\n' || response.back() == '\r'))
        response.pop_back();
    KOVAK_DEBUG("hyprland: '{}' -> '{}'", command, response);
    return response;
}

void HyprlandHotkeyBackend::bind(const HotkeyCombo& combo) {
    // unbind drops every bind on a combination, so never take one that is in use
    if (auto owner = findForeignBind(request("binds"), combo)) {
        throw HotkeyError(combo.toHyprland() + " is already bound in Hyprland (" +
                          (owner->empty() ? "no dispatcher" : *owner) + ")");
    }

    std::string response = request("keyword bind " + combo.toHyprland() + "," + TOGGLE_DISPATCHER);
    if (response == "ok") return;

    std::string message = "Hyprland rejected " + combo.toHyprland() + ": " +
                          (response.empty() ? "no reply" : response);
    if (isKeySyntaxRejection(response)) throw InvalidHotkeySyntax(message);
    throw HotkeyError(message);
}

void HyprlandHotkeyBackend::unbind(const HotkeyCombo& combo) {
    std::string response = request("keyword unbind " + combo.toHyprland());
    if (response != "ok") {
        throw HotkeyError("Hyprland could not unbind " + combo.toHyprland() + ": " + response);
    }
}

} // namespace kovak
