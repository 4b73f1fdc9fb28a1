#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <glib.h>

#include "kovak/Hotkey.hpp"
#include "kovak/HotkeyListener.hpp"
#include "kovak/SettingsStore.hpp"

using namespace kovak;
namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseHotkeyTest, DefaultCombination) {
    HotkeyCombo combo = parseHotkey("shift+space");
    EXPECT_EQ(combo.modifiers, unsigned(MOD_SHIFT));
    EXPECT_EQ(combo.key, "space");
    EXPECT_EQ(combo.toHyprland(), "SHIFT,space");
}

TEST(ParseHotkeyTest, ModifiersInAnyOrderAndCase) {
    HotkeyCombo a = parseHotkey("ctrl+alt+v");
    HotkeyCombo b = parseHotkey(" Alt + CTRL + V ");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.modifiers, unsigned(MOD_CTRL | MOD_ALT));
    EXPECT_EQ(a.key, "v");
    EXPECT_EQ(a.toHyprland(), "CTRL_ALT,v");
}

TEST(ParseHotkeyTest, NamedKeys) {
    EXPECT_EQ(parseHotkey("super+enter").key, "Return");
    EXPECT_EQ(parseHotkey("ctrl+f5").key, "F5");
    EXPECT_EQ(parseHotkey("ctrl+F12").key, "F12");
    EXPECT_EQ(parseHotkey("win+esc").toHyprland(), "SUPER,Escape");
    EXPECT_EQ(parseHotkey("pause").toHyprland(), ",Pause");
}

TEST(ParseHotkeyTest, AllModifiersOrdered) {
    HotkeyCombo combo = parseHotkey("shift+alt+ctrl+super+x");
    EXPECT_EQ(combo.toHyprland(), "SUPER_CTRL_ALT_SHIFT,x");
}

TEST(ParseHotkeyTest, RejectsMalformedInput) {
    const char* cases[] = {
        "",
        "   ",
        "ctrl+",
        "+v",
        "ctrl++v",
        "ctrl+shift",
        "a+b",
        "ctrl+notakey",
        "shift+spacebarx",
    };
    for (const char* text : cases) {
        EXPECT_THROW(parseHotkey(text), InvalidHotkeySyntax) << "input: '" << text << "'";
    }
}

// ============================================================================
// Listener lifecycle
// ============================================================================

namespace {

class FakeBackend : public HotkeyBackend {
public:
    std::vector<std::string> calls;
    std::set<std::string> rejected;      // bind throws InvalidHotkeySyntax
    bool offline = false;                // everything throws HotkeyError
    std::optional<size_t> failBindAt;    // index of the bind call that fails once
    size_t binds = 0;

    void bind(const HotkeyCombo& combo) override {
        size_t index = binds++;
        if (offline) throw HotkeyError("compositor unreachable");
        if (failBindAt && *failBindAt == index) throw HotkeyError("transient failure");
        if (rejected.count(combo.toHyprland())) throw InvalidHotkeySyntax("rejected");
        calls.push_back("bind " + combo.toHyprland());
    }

    void unbind(const HotkeyCombo& combo) override {
        if (offline) throw HotkeyError("compositor unreachable");
        calls.push_back("unbind " + combo.toHyprland());
    }
};

class HotkeyListenerTest : public ::testing::Test {
protected:
    fs::path dir;
    FakeBackend backend;
    std::optional<SettingsStore> store;
    Settings settings;

    void SetUp() override {
        g_autofree gchar* tmp = g_dir_make_tmp("kovak-hotkey-XXXXXX", nullptr);
        ASSERT_NE(tmp, nullptr);
        dir = tmp;
        store.emplace((dir / "Kovak" / "settings.json").string());
        settings = store->load();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

TEST_F(HotkeyListenerTest, RegisterValidatesThenBinds) {
    {
        HotkeyListener listener(backend, *store, settings);
        listener.registerHotkey(settings.hotkey);

        EXPECT_EQ(listener.state(), HotkeyListener::State::Registered);
        EXPECT_EQ(listener.registeredHotkey(), "shift+space");
        EXPECT_EQ(backend.calls, (std::vector<std::string>{
            "bind SHIFT,space", "unbind SHIFT,space", "bind SHIFT,space"}));
    }
    // Destruction releases the binding
    EXPECT_EQ(backend.calls.back(), "unbind SHIFT,space");
}

TEST_F(HotkeyListenerTest, RegisterFailureLeavesUnregistered) {
    backend.offline = true;
    HotkeyListener listener(backend, *store, settings);

    EXPECT_THROW(listener.registerHotkey(settings.hotkey), HotkeyError);
    EXPECT_EQ(listener.state(), HotkeyListener::State::Unregistered);
}

TEST_F(HotkeyListenerTest, SameHotkeyIsUnchanged) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);
    backend.calls.clear();

    HotkeyChange change = listener.changeHotkey("shift+space");
    EXPECT_EQ(change.status, HotkeyChange::Status::Unchanged);
    EXPECT_EQ(change.message, "The new hotkey is the same as the current one");
    EXPECT_TRUE(backend.calls.empty());
    EXPECT_FALSE(fs::exists(store->path()));
}

TEST_F(HotkeyListenerTest, InvalidSyntaxKeepsPreviousBinding) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);
    backend.calls.clear();

    HotkeyChange change = listener.changeHotkey("ctrl+");
    EXPECT_EQ(change.status, HotkeyChange::Status::Invalid);
    EXPECT_EQ(change.message, "Invalid hotkey entered");
    EXPECT_TRUE(backend.calls.empty());
    EXPECT_EQ(listener.registeredHotkey(), "shift+space");
    EXPECT_EQ(settings.hotkey, "shift+space");
}

TEST_F(HotkeyListenerTest, RejectedByBackendIsInvalid) {
    backend.rejected.insert("CTRL,v");
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);

    HotkeyChange change = listener.changeHotkey("ctrl+v");
    EXPECT_EQ(change.status, HotkeyChange::Status::Invalid);
    EXPECT_EQ(listener.state(), HotkeyListener::State::Registered);
    EXPECT_EQ(listener.registeredHotkey(), "shift+space");
    EXPECT_FALSE(fs::exists(store->path()));
}

TEST_F(HotkeyListenerTest, ChangeSwapsBindingAndPersists) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);
    backend.calls.clear();

    HotkeyChange change = listener.changeHotkey("ctrl+alt+h");
    EXPECT_EQ(change.status, HotkeyChange::Status::Changed);
    EXPECT_EQ(backend.calls, (std::vector<std::string>{
        "bind CTRL_ALT,h", "unbind CTRL_ALT,h",
        "unbind SHIFT,space",
        "bind CTRL_ALT,h"}));

    EXPECT_EQ(listener.registeredHotkey(), "ctrl+alt+h");
    EXPECT_EQ(settings.hotkey, "ctrl+alt+h");
    EXPECT_EQ(store->load().hotkey, "ctrl+alt+h");
}

TEST_F(HotkeyListenerTest, UnreachableBackendFails) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);
    backend.offline = true;

    HotkeyChange change = listener.changeHotkey("ctrl+alt+h");
    EXPECT_EQ(change.status, HotkeyChange::Status::Failed);
    EXPECT_EQ(settings.hotkey, "shift+space");
    EXPECT_EQ(listener.registeredHotkey(), "shift+space");

    backend.offline = false;
}

TEST_F(HotkeyListenerTest, BindFailureAfterValidationRestoresPrevious) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);  // binds #0 and #1

    backend.failBindAt = 3;  // #2 validates the new combo, #3 binds it
    HotkeyChange change = listener.changeHotkey("ctrl+alt+h");

    EXPECT_EQ(change.status, HotkeyChange::Status::Failed);
    EXPECT_EQ(listener.state(), HotkeyListener::State::Registered);
    EXPECT_EQ(listener.registeredHotkey(), "shift+space");
    EXPECT_EQ(backend.calls.back(), "bind SHIFT,space");
    EXPECT_EQ(settings.hotkey, "shift+space");
}

TEST_F(HotkeyListenerTest, SettingsWriteFailurePropagates) {
    // Parent of the settings file is a regular file
    fs::path blocker = dir / "blocker";
    { std::ofstream(blocker) << "x"; }
    SettingsStore broken((blocker / "settings.json").string());

    HotkeyListener listener(backend, broken, settings);
    listener.registerHotkey(settings.hotkey);

    EXPECT_ANY_THROW(listener.changeHotkey("ctrl+alt+h"));
}

TEST_F(HotkeyListenerTest, UnregisterReleasesBinding) {
    HotkeyListener listener(backend, *store, settings);
    listener.registerHotkey(settings.hotkey);
    listener.unregister();

    EXPECT_EQ(listener.state(), HotkeyListener::State::Unregistered);
    EXPECT_TRUE(listener.registeredHotkey().empty());
    EXPECT_EQ(backend.calls.back(), "unbind SHIFT,space");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
