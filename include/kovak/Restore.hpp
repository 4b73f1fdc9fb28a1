#pragma once
// Single Responsibility: decide how a history row goes back onto the clipboard

#include "ClipboardEntry.hpp"
#include "HistoryStore.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace kovak {

struct ImagePayload {
    std::vector<std::uint8_t> png;
};

struct ImageFilePayload {
    std::string path;
};

struct UriListPayload {
    std::vector<std::string> uris;
};

struct TextPayload {
    std::string text;
};

using RestorePayload = std::variant<ImagePayload, ImageFilePayload, UriListPayload, TextPayload>;

// Resolution order:
//   1. recorded image with this label and non-empty pixels
//   2. recorded URL list with this display string
//   3. recorded text with this exact content
//   4. path to an existing regular file (raster image or file reference)
//   5. plain text
RestorePayload resolveRestore(const std::string& text, const HistoryStore& history);

// Splits a ", "-joined URL list and turns each piece into a URI,
// treating anything that is not an absolute URI as a local path
std::vector<std::string> toUriList(const std::string& display);

// "file:///abs/path"; relative paths are resolved against the working directory.
// Returns "" if the path cannot be expressed as a URI.
std::string localPathToUri(const std::string& path);

bool hasRasterImageExtension(const std::string& path);

} // namespace kovak
