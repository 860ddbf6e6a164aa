#include <penumbra/texture.h>
#include <penumbra/gpu_context.h>
#include <penumbra/image_loader.h>
#include <penumbra/pipeline_builder.h>

namespace penumbra {

Texture Texture::createDepth(WGPUDevice device, uint32_t width, uint32_t height, const char* label) {
    Texture result;
    result.m_width = width;
    result.m_height = height;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(label);
    texDesc.size = {width, height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = DEPTH_FORMAT;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    result.m_texture.reset(wgpuDeviceCreateTexture(device, &texDesc));

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = DEPTH_FORMAT;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_DepthOnly;
    result.m_view.reset(wgpuTextureCreateView(result.m_texture, &viewDesc));

    return result;
}

Texture Texture::fromImage(WGPUDevice device, WGPUQueue queue, const ImageData& image,
                           const std::string& label) {
    return fromPixels(device, queue, image.pixels.data(),
                      static_cast<uint32_t>(image.width), static_cast<uint32_t>(image.height), label);
}

Texture Texture::solidColor(WGPUDevice device, WGPUQueue queue,
                            uint8_t r, uint8_t g, uint8_t b, uint8_t a, const std::string& label) {
    const uint8_t pixel[4] = {r, g, b, a};
    return fromPixels(device, queue, pixel, 1, 1, label);
}

Texture Texture::fromPixels(WGPUDevice device, WGPUQueue queue, const uint8_t* pixels,
                            uint32_t width, uint32_t height, const std::string& label) {
    Texture result;
    result.m_width = width;
    result.m_height = height;

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView(label.c_str());
    texDesc.size = {width, height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8UnormSrgb;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    result.m_texture.reset(wgpuDeviceCreateTexture(device, &texDesc));

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_RGBA8UnormSrgb;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    result.m_view.reset(wgpuTextureCreateView(result.m_texture, &viewDesc));

    // Upload pixel data
    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = result.m_texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = width * 4;
    dataLayout.rowsPerImage = height;

    WGPUExtent3D writeSize = {width, height, 1};
    wgpuQueueWriteTexture(queue, &destination, pixels,
                          static_cast<size_t>(width) * height * 4, &dataLayout, &writeSize);

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_Repeat;
    samplerDesc.addressModeV = WGPUAddressMode_Repeat;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.maxAnisotropy = 1;
    result.m_sampler.reset(wgpuDeviceCreateSampler(device, &samplerDesc));

    return result;
}

} // namespace penumbra
