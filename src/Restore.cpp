#include "kovak/Restore.hpp"
#include "kovak/Log.hpp"
#include <glib.h>
#include <algorithm>
#include <array>
#include <filesystem>

namespace fs = std::filesystem;

namespace kovak {

static const std::array<const char*, 5> RASTER_EXTENSIONS = {
    ".png", ".jpg", ".jpeg", ".bmp", ".gif"
};

bool hasRasterImageExtension(const std::string& path) {
    g_autofree gchar* lower = g_ascii_strdown(path.c_str(), static_cast<gssize>(path.size()));
    return std::any_of(RASTER_EXTENSIONS.begin(), RASTER_EXTENSIONS.end(),
        [&](const char* ext) { return g_str_has_suffix(lower, ext); });
}

std::string localPathToUri(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    std::string full = ec ? path : absolute.string();

    g_autoptr(GError) error = nullptr;
    g_autofree gchar* uri = g_filename_to_uri(full.c_str(), nullptr, &error);
    if (!uri) {
        KOVAK_WARN("cannot convert '{}' to a file URI: {}", full, error->message);
        return "";
    }
    return uri;
}

std::vector<std::string> toUriList(const std::string& display) {
    std::vector<std::string> uris;

    size_t start = 0;
    while (start <= display.size()) {
        size_t sep = display.find(", ", start);
        std::string piece = display.substr(start, sep == std::string::npos ? std::string::npos
                                                                           : sep - start);
        if (!piece.empty()) {
            if (g_uri_is_valid(piece.c_str(), G_URI_FLAGS_NONE, nullptr)) {
                uris.push_back(piece);
            } else {
                std::string uri = localPathToUri(piece);
                if (!uri.empty()) uris.push_back(std::move(uri));
            }
        }
        if (sep == std::string::npos) break;
        start = sep + 2;
    }
    return uris;
}

RestorePayload resolveRestore(const std::string& text, const HistoryStore& history) {
    const auto& entries = history.all();

    // 1. Image with pixels
    if (const auto* image = history.findImage(text); image && !image->png.empty()) {
        return ImagePayload{image->png};
    }

    // 2. URL list
    bool isUrlList = std::any_of(entries.begin(), entries.end(), [&](const ClipboardEntry& e) {
        const auto* urls = std::get_if<UrlListEntry>(&e);
        return urls && urls->display == text;
    });
    if (isUrlList) {
        auto uris = toUriList(text);
        if (!uris.empty()) return UriListPayload{std::move(uris)};
        return TextPayload{text};
    }

    // 3. Recorded text
    bool isText = std::any_of(entries.begin(), entries.end(), [&](const ClipboardEntry& e) {
        const auto* t = std::get_if<TextEntry>(&e);
        return t && t->content == text;
    });
    if (isText) return TextPayload{text};

    // 4. Existing regular file
    std::error_code ec;
    if (!text.empty() && fs::is_regular_file(text, ec)) {
        if (hasRasterImageExtension(text)) return ImageFilePayload{text};
        std::string uri = localPathToUri(text);
        if (!uri.empty()) return UriListPayload{{uri}};
    }

    // 5. Fallback
    return TextPayload{text};
}

} // namespace kovak
