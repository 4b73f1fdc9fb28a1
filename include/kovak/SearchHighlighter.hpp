#pragma once
// Single Responsibility: find-in-list matching for the history rows

#include <optional>
#include <string>
#include <vector>

namespace kovak {

struct SearchResult {
    std::vector<bool> matches;        // one flag per row, display order
    std::optional<size_t> firstMatch; // row to scroll into view
};

class SearchHighlighter {
public:
    // Case-insensitive substring match. An empty query matches every row.
    static SearchResult search(const std::vector<std::string>& rows, const std::string& query);

    // Clears all match markings
    static SearchResult reset(size_t rowCount);
};

} // namespace kovak
