#pragma once

namespace penumbra {

constexpr const char* VERSION = "0.1.0";

} // namespace penumbra
