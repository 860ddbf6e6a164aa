#pragma once

/**
 * @file shader_library.h
 * @brief WGSL modules compiled once at startup
 *
 * The library is built before any pipeline and handed to pipeline owners by
 * const reference. It never changes after construction.
 *
 * Binding contract shared by the modules:
 * - group 0: camera uniforms (viewPosition, viewProj)
 * - group 1: light count + light array (model), single light record (marker, shadow)
 * - group 2: shadow depth array + comparison sampler
 * - group 3: material texture + sampler
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

namespace penumbra {

class ShaderLibrary {
public:
    /// @throws std::runtime_error if a module fails to compile
    explicit ShaderLibrary(WGPUDevice device);

    ShaderLibrary(const ShaderLibrary&) = delete;
    ShaderLibrary& operator=(const ShaderLibrary&) = delete;

    /// Lit, shadowed model shader (vs_main / fs_main)
    WGPUShaderModule model() const { return m_model; }

    /// Unlit light marker shader (vs_main / fs_main)
    WGPUShaderModule marker() const { return m_marker; }

    /// Depth-only shadow shader (vs_main / fs_main)
    WGPUShaderModule shadow() const { return m_shadow; }

private:
    ShaderModuleHandle m_model;
    ShaderModuleHandle m_marker;
    ShaderModuleHandle m_shadow;
};

} // namespace penumbra
