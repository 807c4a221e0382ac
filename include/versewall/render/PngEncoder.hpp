#pragma once

#include "core/Error.hpp"

#include <versewall/scene/PixelBuffer.hpp>

#include <cstdint>
#include <vector>

namespace VW::Render {

// Encodes an RGBA8 buffer as PNG. Identical buffers give identical bytes.
auto encode_png(Scene::PixelBuffer const& buffer) -> Expected<std::vector<std::uint8_t>>;

} // namespace VW::Render
