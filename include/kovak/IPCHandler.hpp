#pragma once
// Single Responsibility: hyprctl command table (hyprctl kovak <cmd>)

#include "Forward.hpp"
#include <string>
#include <functional>
#include <unordered_map>

namespace kovak {

class IPCHandler {
public:
    using Handler = std::function<std::string(const std::string&)>;

    IPCHandler();
    ~IPCHandler();

    // Command registration
    void registerCommand(const std::string& name, Handler handler);

    // Command execution
    std::string handleCommand(const std::string& command, const std::string& args);

private:
    std::unordered_map<std::string, Handler> m_commands;
};

} // namespace kovak
