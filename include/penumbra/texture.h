#pragma once

/**
 * @file texture.h
 * @brief GPU textures: the main depth buffer and material images
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <string>

namespace penumbra {

struct ImageData;

/// A texture, its default view and, for sampled textures, a sampler
class Texture {
public:
    Texture() = default;

    /// Depth32Float render attachment for the main pass
    static Texture createDepth(WGPUDevice device, uint32_t width, uint32_t height, const char* label);

    /// RGBA8 sRGB texture from decoded pixels, with a linear repeat sampler
    static Texture fromImage(WGPUDevice device, WGPUQueue queue, const ImageData& image,
                             const std::string& label);

    /// 1x1 texture of one colour (RGBA8)
    static Texture solidColor(WGPUDevice device, WGPUQueue queue,
                              uint8_t r, uint8_t g, uint8_t b, uint8_t a, const std::string& label);

    WGPUTexture texture() const { return m_texture; }
    WGPUTextureView view() const { return m_view; }
    WGPUSampler sampler() const { return m_sampler; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

    bool valid() const { return static_cast<bool>(m_texture); }

private:
    static Texture fromPixels(WGPUDevice device, WGPUQueue queue, const uint8_t* pixels,
                              uint32_t width, uint32_t height, const std::string& label);

    TextureHandle m_texture;
    TextureViewHandle m_view;
    SamplerHandle m_sampler;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
};

} // namespace penumbra
