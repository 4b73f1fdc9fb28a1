#pragma once
// Single Responsibility: decide what kind of content the clipboard owner offers

#include <gdk/gdk.h>
#include <string>
#include <vector>

namespace kovak {

enum class ClipboardKind {
    None,
    Image,
    UrlList,
    Text,
};

// Image wins over a URL list, a URL list over text.
// Formats are widened to the GTypes GDK can deserialize them into first.
ClipboardKind classifyFormats(GdkContentFormats* offered);

// Display string of a URL list: URIs joined with ", "
std::string joinUris(const std::vector<std::string>& uris);

const char* toString(ClipboardKind kind);

} // namespace kovak
