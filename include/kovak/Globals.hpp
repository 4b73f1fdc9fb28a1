#pragma once
// Plugin-side state (runs inside the compositor, no GTK)

#include "Forward.hpp"
#include <memory>
#include <string>

namespace kovak {

extern std::unique_ptr<IPCHandler> g_ipcHandler;
extern void* g_handle;

void initGlobals();
void cleanupGlobals();

// Forward a command to the UI process via fork+exec of `kovak-ui --<cmd>`.
// The UI binary hands it to a running instance or starts one.
void sendUICommand(const std::string& cmd);

} // namespace kovak
