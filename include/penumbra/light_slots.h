#pragma once

/**
 * @file light_slots.h
 * @brief Name to array-slot bookkeeping for the light registry
 *
 * Slots are handed out in insertion order and never reused. A name that is
 * already registered keeps its slot.
 */

#include <penumbra/gpu_structs.h>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace penumbra {

enum class LightError {
    None,
    CapacityExceeded,
};

/// Result of registering a light
struct LightSlot {
    uint32_t index = 0;
    LightError error = LightError::None;
    bool replaced = false;   ///< The name was already registered

    explicit operator bool() const { return error == LightError::None; }
};

class LightSlots {
public:
    explicit LightSlots(uint32_t capacity = LIGHT_CAPACITY) : m_capacity(capacity) {}

    /**
     * @brief Find or allocate the slot for a name
     *
     * Existing names return their slot with replaced set. New names get the
     * next index unless capacity lights are already registered, in which case
     * the result carries LightError::CapacityExceeded and nothing changes.
     */
    LightSlot acquire(const std::string& name);

    std::optional<uint32_t> find(const std::string& name) const;
    bool contains(const std::string& name) const { return m_indices.count(name) != 0; }

    uint32_t size() const { return static_cast<uint32_t>(m_names.size()); }
    uint32_t capacity() const { return m_capacity; }
    bool full() const { return size() >= m_capacity; }

    /// Names in slot order
    const std::vector<std::string>& names() const { return m_names; }

private:
    uint32_t m_capacity;
    std::vector<std::string> m_names;
    std::unordered_map<std::string, uint32_t> m_indices;
};

const char* toString(LightError error);

} // namespace penumbra
