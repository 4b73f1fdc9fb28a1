#include "kovak/ClipboardEntry.hpp"

namespace kovak {

const std::string& displayText(const ClipboardEntry& entry) {
    return std::visit(Overloaded{
        [](const TextEntry& e) -> const std::string& { return e.content; },
        [](const UrlListEntry& e) -> const std::string& { return e.display; },
        [](const ImageEntry& e) -> const std::string& { return e.label; },
    }, entry);
}

const char* entryKind(const ClipboardEntry& entry) {
    return std::visit(Overloaded{
        [](const TextEntry&) { return "text"; },
        [](const UrlListEntry&) { return "urls"; },
        [](const ImageEntry&) { return "image"; },
    }, entry);
}

} // namespace kovak
