// Global instance management (plugin side - NO GTK!)
// Never blocks the compositor: the UI is reached through a detached child.

#include "kovak/Globals.hpp"
#include "kovak/IPCHandler.hpp"

#include <unistd.h>
#include <sys/wait.h>

namespace kovak {

std::unique_ptr<IPCHandler> g_ipcHandler;
void* g_handle = nullptr;

void initGlobals() {
    g_ipcHandler = std::make_unique<IPCHandler>();
}

void cleanupGlobals() {
    g_ipcHandler.reset();
}

void sendUICommand(const std::string& cmd) {
    // Reap zombie children from previous calls
    while (waitpid(-1, nullptr, WNOHANG) > 0) {}

    std::string arg = "--" + cmd;
    if (fork() == 0) {
        setsid();  // Detach from compositor process group
        execlp("kovak-ui", "kovak-ui", arg.c_str(), nullptr);
        _exit(1);
    }
}

} // namespace kovak
