#pragma once
// Single Responsibility: persisted user settings (<home>/Kovak/settings.json)

#include <stdexcept>
#include <string>

namespace kovak {

struct Settings {
    std::string hotkey = "shift+space";

    bool operator==(const Settings&) const = default;
};

class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SettingsStore {
public:
    explicit SettingsStore(std::string path);

    // Missing, unreadable or malformed files yield the defaults. Never throws.
    Settings load() const;

    // Creates the containing directory on first use. Throws on any failure.
    void save(const Settings& settings) const;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// JSON helpers, exposed for tests
std::string serializeSettings(const Settings& settings);
bool parseSettings(const std::string& json, Settings& out);

} // namespace kovak
