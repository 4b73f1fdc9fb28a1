// Single Responsibility: persisted user settings
// JSON handling is minimal: a single flat object, only "hotkey" is read.

#include "kovak/SettingsStore.hpp"
#include "kovak/Log.hpp"
#include <glib.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace kovak {

// ============================================================================
// JSON reading
// ============================================================================

namespace {

class JsonReader {
public:
    explicit JsonReader(const std::string& text) : m_text(text) {}

    // Parses the whole document as one object; collects the "hotkey" member
    bool readDocument(std::string& hotkey, bool& hasHotkey) {
        skipWhitespace();
        if (!readObject(&hotkey, &hasHotkey)) return false;
        skipWhitespace();
        return m_pos == m_text.size();
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;
    int m_depth = 0;

    static constexpr int MAX_DEPTH = 64;

    void skipWhitespace() {
        while (m_pos < m_text.size() &&
               (m_text[m_pos] == ' ' || m_text[m_pos] == '\t' ||
                m_text[m_pos] == '\n' || m_text[m_pos] == '\r')) {
            m_pos++;
        }
    }

    bool consume(char c) {
        skipWhitespace();
        if (m_pos < m_text.size() && m_text[m_pos] == c) {
            m_pos++;
            return true;
        }
        return false;
    }

    bool readHex4(unsigned& out) {
        if (m_pos + 4 > m_text.size()) return false;
        out = 0;
        for (int i = 0; i < 4; i++) {
            int digit = g_ascii_xdigit_value(m_text[m_pos++]);
            if (digit < 0) return false;
            out = (out << 4) | static_cast<unsigned>(digit);
        }
        return true;
    }

    void appendUtf8(std::string& out, gunichar ch) {
        char buf[6];
        int len = g_unichar_to_utf8(ch, buf);
        out.append(buf, static_cast<size_t>(len));
    }

    bool readString(std::string& out) {
        skipWhitespace();
        if (m_pos >= m_text.size() || m_text[m_pos] != '"') return false;
        m_pos++;

        while (m_pos < m_text.size()) {
            char c = m_text[m_pos++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (m_pos >= m_text.size()) return false;
            char esc = m_text[m_pos++];
            switch (esc) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                unsigned unit = 0;
                if (!readHex4(unit)) return false;
                if (unit >= 0xD800 && unit <= 0xDBFF) {
                    // Surrogate pair
                    unsigned low = 0;
                    if (m_pos + 2 > m_text.size() || m_text[m_pos] != '\\' ||
                        m_text[m_pos + 1] != 'u') {
                        return false;
                    }
                    m_pos += 2;
                    if (!readHex4(low) || low < 0xDC00 || low > 0xDFFF) return false;
                    unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
                    return false;
                }
                appendUtf8(out, unit);
                break;
            }
            default:
                return false;
            }
        }
        return false;
    }

    bool readLiteral(const char* word) {
        size_t len = std::strlen(word);
        if (m_text.compare(m_pos, len, word) != 0) return false;
        m_pos += len;
        return true;
    }

    bool readNumber() {
        size_t start = m_pos;
        if (m_pos < m_text.size() && m_text[m_pos] == '-') m_pos++;
        while (m_pos < m_text.size() &&
               (g_ascii_isdigit(m_text[m_pos]) || m_text[m_pos] == '.' ||
                m_text[m_pos] == 'e' || m_text[m_pos] == 'E' ||
                m_text[m_pos] == '+' || m_text[m_pos] == '-')) {
            m_pos++;
        }
        if (m_pos == start) return false;
        std::string token = m_text.substr(start, m_pos - start);
        char* end = nullptr;
        g_ascii_strtod(token.c_str(), &end);
        return end && *end == '\0';
    }

    bool readArray() {
        if (!consume('[')) return false;
        if (consume(']')) return true;
        do {
            if (!skipValue()) return false;
        } while (consume(','));
        return consume(']');
    }

    bool readObject(std::string* hotkey, bool* hasHotkey) {
        if (!consume('{')) return false;
        if (consume('}')) return true;
        do {
            std::string key;
            if (!readString(key)) return false;
            if (!consume(':')) return false;

            skipWhitespace();
            if (hotkey && key == "hotkey" && m_pos < m_text.size() && m_text[m_pos] == '"') {
                hotkey->clear();
                if (!readString(*hotkey)) return false;
                *hasHotkey = true;
            } else {
                if (hotkey && key == "hotkey") *hasHotkey = false;
                if (!skipValue()) return false;
            }
        } while (consume(','));
        return consume('}');
    }

    bool skipValue() {
        skipWhitespace();
        if (m_pos >= m_text.size()) return false;
        switch (m_text[m_pos]) {
        case '{':
        case '[': {
            // Nesting is bounded; deeper documents are rejected as malformed
            if (m_depth >= MAX_DEPTH) return false;
            m_depth++;
            bool ok = m_text[m_pos] == '{' ? readObject(nullptr, nullptr) : readArray();
            m_depth--;
            return ok;
        }
        case '"': {
            std::string ignored;
            return readString(ignored);
        }
        case 't': return readLiteral("true");
        case 'f': return readLiteral("false");
        case 'n': return readLiteral("null");
        default:  return readNumber();
        }
    }
};

std::string escapeJson(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                g_snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

} // namespace

bool parseSettings(const std::string& json, Settings& out) {
    std::string hotkey;
    bool hasHotkey = false;
    JsonReader reader(json);
    if (!reader.readDocument(hotkey, hasHotkey)) return false;
    if (!hasHotkey || hotkey.empty()) return false;
    out.hotkey = hotkey;
    return true;
}

std::string serializeSettings(const Settings& settings) {
    return "{\"hotkey\": \"" + escapeJson(settings.hotkey) + "\"}";
}

// ============================================================================
// SettingsStore
// ============================================================================

SettingsStore::SettingsStore(std::string path)
    : m_path(std::move(path)) {
}

Settings SettingsStore::load() const {
    Settings defaults;

    std::ifstream file(m_path);
    if (!file.is_open()) {
        KOVAK_DEBUG("no settings at {}, using defaults", m_path);
        return defaults;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Settings settings;
    if (!parseSettings(buffer.str(), settings)) {
        KOVAK_DEBUG("settings at {} are malformed, using defaults", m_path);
        return defaults;
    }
    return settings;
}

void SettingsStore::save(const Settings& settings) const {
    fs::path path(m_path);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw SettingsError("cannot open " + m_path + ": " + std::strerror(errno));
    }

    file << serializeSettings(settings);
    file.flush();
    if (!file) {
        throw SettingsError("cannot write " + m_path);
    }
    KOVAK_DEBUG("saved settings to {}", m_path);
}

} // namespace kovak
