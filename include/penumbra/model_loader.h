#pragma once

/**
 * @file model_loader.h
 * @brief Model loading via Assimp, material textures via stb_image
 */

#include <penumbra/gpu_structs.h>
#include <penumbra/model.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <string>
#include <vector>

namespace penumbra {

class BindGroupLayouts;

/// CPU-side mesh as read from the file (node transforms applied)
struct ParsedMesh {
    std::string name;
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    uint32_t materialIndex = 0;
};

/// CPU-side material; diffusePath is resolved against the model's directory
struct ParsedMaterial {
    std::string name;
    std::string diffusePath;   ///< Empty when the material has no diffuse texture
};

struct ParsedModel {
    std::vector<ParsedMesh> meshes;
    std::vector<ParsedMaterial> materials;

    bool valid() const { return !meshes.empty(); }
};

/// Check if a file extension is one Assimp imports
bool isFormatSupported(const std::string& path);

/// Read a model file; returns an empty ParsedModel (and logs) on failure
ParsedModel parseModel(const std::string& path);

/**
 * @brief Load a model and upload it
 *
 * Materials whose texture cannot be loaded (or that have none) get a 1x1
 * white texture.
 *
 * @throws std::runtime_error if the file has no usable geometry
 */
Model loadModel(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
                const std::string& path);

} // namespace penumbra
