#pragma once
// Single Responsibility: ordered, duplicate-free clipboard history

#include "ClipboardEntry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kovak {

class HistoryStore {
public:
    // No-op when a structurally equal entry is already present
    bool append(ClipboardEntry entry);

    // Empties the history and forgets the last observed snapshot
    void clear();

    bool contains(const ClipboardEntry& entry) const;
    const ImageEntry* findImage(const std::string& label) const;

    const std::vector<ClipboardEntry>& all() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Presentation rows: each entry's display text followed by a blank spacer
    std::vector<std::string> rows() const;

    const std::optional<ClipboardEntry>& lastObserved() const { return m_lastObserved; }
    void setLastObserved(ClipboardEntry entry) { m_lastObserved = std::move(entry); }

private:
    std::vector<ClipboardEntry> m_entries;
    std::optional<ClipboardEntry> m_lastObserved;
};

} // namespace kovak
