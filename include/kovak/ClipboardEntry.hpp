#pragma once
// Single Responsibility: data structure for clipboard items

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace kovak {

struct TextEntry {
    std::string content;
};

struct UrlListEntry {
    std::string display;      // URLs joined with ", "
};

struct ImageEntry {
    std::string label;        // Derived from the content hash
    std::vector<std::uint8_t> png;  // Normalized pixels, PNG encoded
};

using ClipboardEntry = std::variant<TextEntry, UrlListEntry, ImageEntry>;

// Visitor helper for exhaustive std::visit
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// Structural equality: same alternative and same identifying payload.
// Image pixels are not compared, only the hash-derived label.
inline bool operator==(const TextEntry& a, const TextEntry& b) { return a.content == b.content; }
inline bool operator==(const UrlListEntry& a, const UrlListEntry& b) { return a.display == b.display; }
inline bool operator==(const ImageEntry& a, const ImageEntry& b) { return a.label == b.label; }

// Text shown for the entry in the history list
const std::string& displayText(const ClipboardEntry& entry);

const char* entryKind(const ClipboardEntry& entry);

} // namespace kovak
