#pragma once
// Single Responsibility: image normalization, lossless encoding and labeling

#include "ClipboardEntry.hpp"
#include <gdk/gdk.h>
#include <cstdint>
#include <string>
#include <vector>

namespace kovak {

// Converts to the ARGB32 layout (GDK_MEMORY_DEFAULT) and encodes as PNG.
// Returns an empty buffer for an empty or undecodable texture.
std::vector<std::uint8_t> encodeNormalizedPng(GdkTexture* texture);

// MD5 over the encoded bytes, as 32 lowercase hex digits
std::string imageHash(const std::vector<std::uint8_t>& png);

// "Image which has no path (hash: <md5>)"
std::string imageLabel(const std::vector<std::uint8_t>& png);

ImageEntry makeImageEntry(GdkTexture* texture);

// Decodes PNG bytes back into a texture; nullptr on failure. Caller owns the reference.
GdkTexture* decodePng(const std::vector<std::uint8_t>& png);

} // namespace kovak
