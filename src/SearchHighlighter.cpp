#include "kovak/SearchHighlighter.hpp"
#include <glib.h>

namespace kovak {

static std::string toLower(const std::string& s) {
    g_autofree gchar* lower = g_utf8_strdown(s.c_str(), static_cast<gssize>(s.size()));
    return lower;
}

SearchResult SearchHighlighter::search(const std::vector<std::string>& rows,
                                       const std::string& query) {
    SearchResult result;
    result.matches.reserve(rows.size());

    std::string needle = toLower(query);
    for (size_t i = 0; i < rows.size(); i++) {
        bool match = toLower(rows[i]).find(needle) != std::string::npos;
        result.matches.push_back(match);
        if (match && !result.firstMatch) result.firstMatch = i;
    }
    return result;
}

SearchResult SearchHighlighter::reset(size_t rowCount) {
    return SearchResult{std::vector<bool>(rowCount, false), std::nullopt};
}

} // namespace kovak
