#include "kovak/ImageCodec.hpp"
#include "kovak/Log.hpp"

namespace kovak {

std::vector<std::uint8_t> encodeNormalizedPng(GdkTexture* texture) {
    if (!texture) return {};

    int width = gdk_texture_get_width(texture);
    int height = gdk_texture_get_height(texture);
    if (width <= 0 || height <= 0) return {};

    // gdk_texture_download always produces GDK_MEMORY_DEFAULT
    gsize stride = static_cast<gsize>(width) * 4;
    gsize size = stride * static_cast<gsize>(height);
    auto* pixels = static_cast<guchar*>(g_malloc(size));
    gdk_texture_download(texture, pixels, stride);

    g_autoptr(GBytes) pixelBytes = g_bytes_new_take(pixels, size);
    g_autoptr(GdkTexture) normalized =
        gdk_memory_texture_new(width, height, GDK_MEMORY_DEFAULT, pixelBytes, stride);

    g_autoptr(GBytes) png = gdk_texture_save_to_png_bytes(normalized);
    if (!png) {
        KOVAK_WARN("failed to encode {}x{} image as PNG", width, height);
        return {};
    }

    gsize len = 0;
    const auto* data = static_cast<const std::uint8_t*>(g_bytes_get_data(png, &len));
    return std::vector<std::uint8_t>(data, data + len);
}

std::string imageHash(const std::vector<std::uint8_t>& png) {
    g_autofree gchar* hex = g_compute_checksum_for_data(
        G_CHECKSUM_MD5, png.data(), png.size());
    return hex;
}

std::string imageLabel(const std::vector<std::uint8_t>& png) {
    return "Image which has no path (hash: " + imageHash(png) + ")";
}

ImageEntry makeImageEntry(GdkTexture* texture) {
    ImageEntry entry;
    entry.png = encodeNormalizedPng(texture);
    entry.label = imageLabel(entry.png);
    return entry;
}

GdkTexture* decodePng(const std::vector<std::uint8_t>& png) {
    if (png.empty()) return nullptr;

    g_autoptr(GBytes) bytes = g_bytes_new(png.data(), png.size());
    g_autoptr(GError) error = nullptr;
    GdkTexture* texture = gdk_texture_new_from_bytes(bytes, &error);
    if (!texture) {
        KOVAK_WARN("failed to decode stored image: {}", error ? error->message : "unknown error");
    }
    return texture;
}

} // namespace kovak
