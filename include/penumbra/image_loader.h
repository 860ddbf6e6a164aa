#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace penumbra {

/// Decoded image, always RGBA8
struct ImageData {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;   ///< Channels in the source file

    bool valid() const { return !pixels.empty() && width > 0 && height > 0; }
};

/// Load an image file; returns an invalid ImageData (and logs) on failure
ImageData loadImage(const std::string& path);

} // namespace penumbra
