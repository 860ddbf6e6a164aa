#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <penumbra/image_loader.h>

#include <iostream>

namespace penumbra {

ImageData loadImage(const std::string& path) {
    ImageData result;

    // Force RGBA output
    int width, height, channels;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[ImageLoader] Failed to load image: " << path
                  << " - " << stbi_failure_reason() << std::endl;
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);

    stbi_image_free(data);
    return result;
}

} // namespace penumbra
