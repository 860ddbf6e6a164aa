#pragma once

/**
 * @file model.h
 * @brief Meshes, their materials and the instances they are drawn at
 */

#include <penumbra/gpu_handle.h>
#include <penumbra/instance.h>
#include <penumbra/mesh.h>
#include <penumbra/texture.h>

#include <webgpu/webgpu.h>

#include <string>
#include <vector>

namespace penumbra {

class BindGroupLayouts;

/// Diffuse texture plus its group-3 bind group
class Material {
public:
    Material(WGPUDevice device, const BindGroupLayouts& layouts, std::string name, Texture diffuse);

    Material(Material&&) = default;
    Material& operator=(Material&&) = default;

    const std::string& name() const { return m_name; }
    const Texture& diffuse() const { return m_diffuse; }
    WGPUBindGroup bindGroup() const { return m_bindGroup; }

private:
    std::string m_name;
    Texture m_diffuse;
    BindGroupHandle m_bindGroup;
};

/**
 * @brief A loaded model and the instances it is drawn at
 *
 * Every mesh is drawn once per frame with all instances. Meshes reference
 * materials by index; a model always has at least one material.
 */
class Model {
public:
    Model() = default;
    Model(std::vector<Mesh> meshes, std::vector<Material> materials);

    Model(Model&&) = default;
    Model& operator=(Model&&) = default;

    const std::vector<Mesh>& meshes() const { return m_meshes; }
    const std::vector<Material>& materials() const { return m_materials; }

    /// Material for a mesh (index clamped to the material list)
    const Material& materialFor(const Mesh& mesh) const;

    const std::vector<Instance>& instances() const { return m_instances; }

    /// Replace all instances; the instance buffer grows as needed
    void setInstances(WGPUDevice device, WGPUQueue queue, std::vector<Instance> instances);

    /// Replace one instance in place
    void updateInstance(WGPUQueue queue, size_t index, const Instance& instance);

    WGPUBuffer instanceBuffer() const { return m_instanceBuffer; }
    uint32_t instanceCount() const { return static_cast<uint32_t>(m_instances.size()); }

    /// Bind buffers and issue one instanced indexed draw per mesh.
    /// Material bind groups are set at materialGroup unless it is negative.
    void draw(WGPURenderPassEncoder pass, int materialGroup) const;

    /// Same as draw() but for the single instance at index
    void drawInstance(WGPURenderPassEncoder pass, int materialGroup, uint32_t index) const;

private:
    void drawRange(WGPURenderPassEncoder pass, int materialGroup,
                   uint32_t firstInstance, uint32_t count) const;

    std::vector<Mesh> m_meshes;
    std::vector<Material> m_materials;
    std::vector<Instance> m_instances;
    BufferHandle m_instanceBuffer;
    size_t m_instanceCapacity = 0;
};

} // namespace penumbra
