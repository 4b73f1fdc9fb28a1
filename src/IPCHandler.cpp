// Single Responsibility: IPC command handling

#include "kovak/IPCHandler.hpp"
#include "kovak/Globals.hpp"

namespace kovak {

IPCHandler::IPCHandler() {
    // Every standard command is forwarded to the UI process as-is
    for (const char* name : {"show", "hide", "toggle", "clear", "quit"}) {
        std::string reply = std::string(name) + ": sent";
        registerCommand(name, [name, reply](const std::string&) {
            sendUICommand(name);
            return reply;
        });
    }

    registerCommand("help", [this](const std::string&) {
        std::string result = "commands:";
        for (const auto& [name, _] : m_commands) result += " " + name;
        return result;
    });
}

IPCHandler::~IPCHandler() = default;

void IPCHandler::registerCommand(const std::string& name, Handler handler) {
    m_commands[name] = std::move(handler);
}

std::string IPCHandler::handleCommand(const std::string& command,
                                      const std::string& args) {
    auto it = m_commands.find(command);
    if (it != m_commands.end()) {
        return it->second(args);
    }
    return "unknown command: " + command;
}

} // namespace kovak
