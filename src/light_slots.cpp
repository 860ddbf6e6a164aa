#include <penumbra/light_slots.h>

namespace penumbra {

LightSlot LightSlots::acquire(const std::string& name) {
    LightSlot slot;

    auto it = m_indices.find(name);
    if (it != m_indices.end()) {
        slot.index = it->second;
        slot.replaced = true;
        return slot;
    }

    if (full()) {
        slot.error = LightError::CapacityExceeded;
        return slot;
    }

    slot.index = size();
    m_names.push_back(name);
    m_indices.emplace(name, slot.index);
    return slot;
}

std::optional<uint32_t> LightSlots::find(const std::string& name) const {
    auto it = m_indices.find(name);
    if (it == m_indices.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* toString(LightError error) {
    switch (error) {
        case LightError::None: return "none";
        case LightError::CapacityExceeded: return "light capacity exceeded";
    }
    return "unknown";
}

} // namespace penumbra
