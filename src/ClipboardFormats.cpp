#include "kovak/ClipboardFormats.hpp"

namespace kovak {

ClipboardKind classifyFormats(GdkContentFormats* offered) {
    if (!offered) return ClipboardKind::None;

    g_autoptr(GdkContentFormats) formats =
        gdk_content_formats_union_deserialize_gtypes(gdk_content_formats_ref(offered));

    if (gdk_content_formats_contain_gtype(formats, GDK_TYPE_TEXTURE)) {
        return ClipboardKind::Image;
    }
    if (gdk_content_formats_contain_gtype(formats, GDK_TYPE_FILE_LIST) ||
        gdk_content_formats_contain_mime_type(formats, "text/uri-list")) {
        return ClipboardKind::UrlList;
    }
    if (gdk_content_formats_contain_gtype(formats, G_TYPE_STRING)) {
        return ClipboardKind::Text;
    }
    return ClipboardKind::None;
}

std::string joinUris(const std::vector<std::string>& uris) {
    std::string display;
    for (const auto& uri : uris) {
        if (uri.empty()) continue;
        if (!display.empty()) display += ", ";
        display += uri;
    }
    return display;
}

const char* toString(ClipboardKind kind) {
    switch (kind) {
    case ClipboardKind::None:    return "none";
    case ClipboardKind::Image:   return "image";
    case ClipboardKind::UrlList: return "urls";
    case ClipboardKind::Text:    return "text";
    }
    return "unknown";
}

} // namespace kovak
