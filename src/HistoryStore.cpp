#include "kovak/HistoryStore.hpp"
#include <algorithm>

namespace kovak {

bool HistoryStore::append(ClipboardEntry entry) {
    if (contains(entry)) return false;
    m_entries.push_back(std::move(entry));
    return true;
}

void HistoryStore::clear() {
    m_entries.clear();
    m_lastObserved.reset();
}

bool HistoryStore::contains(const ClipboardEntry& entry) const {
    return std::find(m_entries.begin(), m_entries.end(), entry) != m_entries.end();
}

const ImageEntry* HistoryStore::findImage(const std::string& label) const {
    for (const auto& entry : m_entries) {
        const auto* image = std::get_if<ImageEntry>(&entry);
        if (image && image->label == label) return image;
    }
    return nullptr;
}

std::vector<std::string> HistoryStore::rows() const {
    std::vector<std::string> rows;
    rows.reserve(m_entries.size() * 2);
    for (const auto& entry : m_entries) {
        rows.push_back(displayText(entry));
        rows.emplace_back();
    }
    return rows;
}

} // namespace kovak
