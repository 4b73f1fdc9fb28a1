#pragma once
// Single Responsibility: decide what a classified clipboard snapshot means
// for the history (baseline, repeat, duplicate or new entry)

#include "ClipboardEntry.hpp"
#include "HistoryStore.hpp"
#include <functional>
#include <optional>
#include <string>

namespace kovak {

enum class PollOutcome {
    NoContent,   // nothing actionable on the clipboard
    KnownImage,  // image already recorded, tick ignored entirely
    Unchanged,   // same as the previous tick
    Baseline,    // first observation since start or clear(), not recorded
    Duplicate,   // changed, but already in the history
    Appended,    // recorded as a new entry
};

class ClipboardPoller {
public:
    // Receives the rows to append to the presentation list
    using RowSink = std::function<void(const std::string& row)>;

    explicit ClipboardPoller(HistoryStore& history);

    void setRowSink(RowSink sink) { m_rowSink = std::move(sink); }

    PollOutcome observe(std::optional<ClipboardEntry> snapshot);

private:
    HistoryStore& m_history;
    RowSink m_rowSink;
};

const char* toString(PollOutcome outcome);

} // namespace kovak
