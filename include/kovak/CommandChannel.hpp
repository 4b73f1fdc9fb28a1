#pragma once
// Single Responsibility: hand commands from the listener thread to the UI thread
// The listener blocks on the UI socket; the UI thread drains the queue
// from its own main loop.

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kovak {

enum class UiCommand {
    Toggle,
    Show,
    Hide,
    Clear,
    Quit,
};

std::optional<UiCommand> parseUiCommand(const std::string& word);
const char* toString(UiCommand command);

class CommandQueue {
public:
    // Called after every push, on the pushing thread
    void setWakeup(std::function<void()> wakeup);

    void push(UiCommand command);
    std::vector<UiCommand> drain();

private:
    std::mutex m_mutex;
    std::deque<UiCommand> m_pending;
    std::function<void()> m_wakeup;
};

class CommandListener {
public:
    explicit CommandListener(CommandQueue& queue);
    ~CommandListener();

    CommandListener(const CommandListener&) = delete;
    CommandListener& operator=(const CommandListener&) = delete;

    // Binds the socket and starts the listener thread
    bool start(const std::string& socketPath);
    void stop();

    bool running() const { return m_running; }

private:
    CommandQueue& m_queue;
    std::string m_socketPath;
    int m_listenSock = -1;
    std::thread m_thread;
    std::atomic<bool> m_running{false};

    void run();
};

} // namespace kovak
