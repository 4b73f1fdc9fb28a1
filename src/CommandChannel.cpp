#include "kovak/CommandChannel.hpp"
#include "kovak/Log.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace kovak {

// ============================================================================
// Wire words
// ============================================================================

std::optional<UiCommand> parseUiCommand(const std::string& word) {
    std::string w = word;
    while (!w.empty() && (w.back() == '\n' || w.back() == '\r' || w.back() == ' '))
        w.pop_back();

    if (w == "toggle") return UiCommand::Toggle;
    if (w == "show")   return UiCommand::Show;
    if (w == "hide")   return UiCommand::Hide;
    if (w == "clear")  return UiCommand::Clear;
    if (w == "quit")   return UiCommand::Quit;
    return std::nullopt;
}

const char* toString(UiCommand command) {
    switch (command) {
    case UiCommand::Toggle: return "toggle";
    case UiCommand::Show:   return "show";
    case UiCommand::Hide:   return "hide";
    case UiCommand::Clear:  return "clear";
    case UiCommand::Quit:   return "quit";
    }
    return "unknown";
}

// ============================================================================
// CommandQueue
// ============================================================================

void CommandQueue::setWakeup(std::function<void()> wakeup) {
    std::lock_guard lock(m_mutex);
    m_wakeup = std::move(wakeup);
}

void CommandQueue::push(UiCommand command) {
    std::function<void()> wakeup;
    {
        std::lock_guard lock(m_mutex);
        m_pending.push_back(command);
        wakeup = m_wakeup;
    }
    if (wakeup) wakeup();
}

std::vector<UiCommand> CommandQueue::drain() {
    std::lock_guard lock(m_mutex);
    std::vector<UiCommand> out(m_pending.begin(), m_pending.end());
    m_pending.clear();
    return out;
}

// ============================================================================
// CommandListener
// ============================================================================

CommandListener::CommandListener(CommandQueue& queue)
    : m_queue(queue) {
}

CommandListener::~CommandListener() {
    stop();
}

bool CommandListener::start(const std::string& socketPath) {
    if (m_running) return true;

    struct sockaddr_un addr{};
    if (socketPath.size() >= sizeof(addr.sun_path)) {
        KOVAK_ERROR("socket path too long: {}", socketPath);
        return false;
    }

    unlink(socketPath.c_str());

    m_listenSock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_listenSock == -1) {
        KOVAK_ERROR("socket(): {}", std::strerror(errno));
        return false;
    }

    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(m_listenSock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1 ||
        listen(m_listenSock, 5) == -1) {
        KOVAK_ERROR("cannot listen on {}: {}", socketPath, std::strerror(errno));
        close(m_listenSock);
        m_listenSock = -1;
        return false;
    }

    m_socketPath = socketPath;
    m_running = true;
    m_thread = std::thread(&CommandListener::run, this);
    KOVAK_DEBUG("listening for commands on {}", socketPath);
    return true;
}

void CommandListener::stop() {
    if (!m_running.exchange(false)) return;

    // Wakes the blocked accept()
    shutdown(m_listenSock, SHUT_RDWR);
    if (m_thread.joinable()) m_thread.join();

    close(m_listenSock);
    m_listenSock = -1;
    unlink(m_socketPath.c_str());
}

void CommandListener::run() {
    while (m_running) {
        int clientSock = accept4(m_listenSock, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientSock == -1) {
            if (errno == EINTR) continue;
            if (m_running) KOVAK_WARN("accept(): {}", std::strerror(errno));
            break;
        }

        char buf[64] = {};
        ssize_t n = read(clientSock, buf, sizeof(buf) - 1);
        close(clientSock);
        if (n <= 0) continue;

        std::string word(buf, static_cast<size_t>(n));
        if (auto command = parseUiCommand(word)) {
            m_queue.push(*command);
        } else {
            KOVAK_WARN("unknown command '{}'", word);
        }
    }
}

} // namespace kovak
