#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace VW::Scene {

// RGBA8, straight alpha, sRGB encoded, tightly packed rows.
struct PixelBuffer {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgba;

    [[nodiscard]] auto row_bytes() const -> std::size_t {
        return static_cast<std::size_t>(width) * 4u;
    }

    [[nodiscard]] auto pixel(int x, int y) const -> std::array<std::uint8_t, 4> {
        auto offset = static_cast<std::size_t>(y) * row_bytes() + static_cast<std::size_t>(x) * 4u;
        return {rgba[offset], rgba[offset + 1], rgba[offset + 2], rgba[offset + 3]};
    }
};

using PixelBufferPtr = std::shared_ptr<PixelBuffer const>;

} // namespace VW::Scene
