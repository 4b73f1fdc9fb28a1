#pragma once
// Forward declarations for loose coupling

namespace kovak {

// Data structures
struct Config;
struct Settings;
struct HotkeyCombo;

// Components (one responsibility each)
class SettingsStore;
class HistoryStore;
class ClipboardPoller;
class ClipboardManager;
class ClipboardRenderer;
class HotkeyBackend;
class HotkeyBinding;
class HotkeyListener;
class CommandQueue;
class CommandListener;
class IPCHandler;

} // namespace kovak
