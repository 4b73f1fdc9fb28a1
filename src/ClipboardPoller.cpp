#include "kovak/ClipboardPoller.hpp"
#include "kovak/Log.hpp"

namespace kovak {

ClipboardPoller::ClipboardPoller(HistoryStore& history)
    : m_history(history) {
}

PollOutcome ClipboardPoller::observe(std::optional<ClipboardEntry> snapshot) {
    if (!snapshot) return PollOutcome::NoContent;

    // A recorded image short-circuits before the baseline is touched
    if (const auto* image = std::get_if<ImageEntry>(&*snapshot)) {
        if (m_history.findImage(image->label)) return PollOutcome::KnownImage;
    }

    const auto& last = m_history.lastObserved();
    if (last && *last == *snapshot) return PollOutcome::Unchanged;

    if (!last) {
        m_history.setLastObserved(std::move(*snapshot));
        return PollOutcome::Baseline;
    }

    if (m_history.contains(*snapshot)) {
        m_history.setLastObserved(std::move(*snapshot));
        return PollOutcome::Duplicate;
    }

    std::string row = displayText(*snapshot);
    KOVAK_DEBUG("new {} entry ({} bytes of text)", entryKind(*snapshot), row.size());

    m_history.append(*snapshot);
    m_history.setLastObserved(std::move(*snapshot));

    if (m_rowSink) {
        m_rowSink(row);
        m_rowSink("");
    }
    return PollOutcome::Appended;
}

const char* toString(PollOutcome outcome) {
    switch (outcome) {
    case PollOutcome::NoContent:  return "no-content";
    case PollOutcome::KnownImage: return "known-image";
    case PollOutcome::Unchanged:  return "unchanged";
    case PollOutcome::Baseline:   return "baseline";
    case PollOutcome::Duplicate:  return "duplicate";
    case PollOutcome::Appended:   return "appended";
    }
    return "unknown";
}

} // namespace kovak
