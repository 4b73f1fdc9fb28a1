#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <glib.h>
#include <unistd.h>

#include "kovak/CommandChannel.hpp"
#include "kovak/UnixSocket.hpp"

using namespace kovak;

TEST(UiCommandTest, ParsesWireWords) {
    EXPECT_EQ(parseUiCommand("toggle"), UiCommand::Toggle);
    EXPECT_EQ(parseUiCommand("show\n"), UiCommand::Show);
    EXPECT_EQ(parseUiCommand("hide\r\n"), UiCommand::Hide);
    EXPECT_EQ(parseUiCommand("clear "), UiCommand::Clear);
    EXPECT_EQ(parseUiCommand("quit"), UiCommand::Quit);

    EXPECT_FALSE(parseUiCommand("").has_value());
    EXPECT_FALSE(parseUiCommand("Toggle").has_value());
    EXPECT_FALSE(parseUiCommand("toggle now").has_value());
}

TEST(UiCommandTest, NamesMatchWireWords) {
    for (UiCommand c : {UiCommand::Toggle, UiCommand::Show, UiCommand::Hide,
                        UiCommand::Clear, UiCommand::Quit}) {
        EXPECT_EQ(parseUiCommand(toString(c)), c);
    }
}

TEST(CommandQueueTest, DrainReturnsInOrderAndEmpties) {
    CommandQueue queue;
    queue.push(UiCommand::Show);
    queue.push(UiCommand::Toggle);

    EXPECT_EQ(queue.drain(), (std::vector<UiCommand>{UiCommand::Show, UiCommand::Toggle}));
    EXPECT_TRUE(queue.drain().empty());
}

TEST(CommandQueueTest, PushFromAnotherThreadWakesConsumer) {
    CommandQueue queue;
    std::mutex mutex;
    std::condition_variable cv;
    int wakeups = 0;

    queue.setWakeup([&]() {
        std::lock_guard lock(mutex);
        wakeups++;
        cv.notify_all();
    });

    std::thread producer([&]() {
        queue.push(UiCommand::Toggle);
        queue.push(UiCommand::Hide);
    });
    producer.join();

    std::unique_lock lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return wakeups == 2; }));
    EXPECT_EQ(queue.drain(), (std::vector<UiCommand>{UiCommand::Toggle, UiCommand::Hide}));
}

TEST(CommandListenerTest, SocketCommandsReachQueue) {
    g_autofree gchar* dir = g_dir_make_tmp("kovak-cmd-XXXXXX", nullptr);
    ASSERT_NE(dir, nullptr);
    std::string path = std::string(dir) + "/ui.sock";

    CommandQueue queue;
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<UiCommand> received;
    queue.setWakeup([&]() {
        std::lock_guard lock(mutex);
        for (UiCommand c : queue.drain()) received.push_back(c);
        cv.notify_all();
    });

    CommandListener listener(queue);
    ASSERT_TRUE(listener.start(path));
    EXPECT_TRUE(listener.running());

    EXPECT_TRUE(sendSocketRequest(path, "show", false).has_value());
    EXPECT_TRUE(sendSocketRequest(path, "bogus", false).has_value());
    EXPECT_TRUE(sendSocketRequest(path, "toggle\n", false).has_value());

    {
        std::unique_lock lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2),
                                [&] { return received.size() == 2; }));
        EXPECT_EQ(received, (std::vector<UiCommand>{UiCommand::Show, UiCommand::Toggle}));
    }

    listener.stop();
    EXPECT_FALSE(listener.running());
    EXPECT_FALSE(sendSocketRequest(path, "show", false).has_value());

    rmdir(dir);
}

TEST(CommandListenerTest, NoListenerMeansNoDelivery) {
    EXPECT_FALSE(sendSocketRequest("", "show", false).has_value());
    EXPECT_FALSE(sendSocketRequest("/nonexistent/kovak.sock", "show", false).has_value());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
