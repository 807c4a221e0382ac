#include <versewall/render/PngEncoder.hpp>

#include <cstdlib>
#include <limits>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace VW::Render {

auto encode_png(Scene::PixelBuffer const& buffer) -> Expected<std::vector<std::uint8_t>> {
    if (buffer.width <= 0 || buffer.height <= 0) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "invalid png dimensions"});
    }
    auto row_bytes = buffer.row_bytes();
    if (buffer.rgba.size() != row_bytes * static_cast<std::size_t>(buffer.height)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "pixel buffer has unexpected length"});
    }
    if (row_bytes > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "png row too wide"});
    }

    int length = 0;
    auto* encoded = stbi_write_png_to_mem(buffer.rgba.data(),
                                          static_cast<int>(row_bytes),
                                          buffer.width,
                                          buffer.height,
                                          4,
                                          &length);
    if (encoded == nullptr || length <= 0) {
        if (encoded != nullptr) {
            STBIW_FREE(encoded);
        }
        return std::unexpected(Error{Error::Code::RenderFailed, "failed to encode png"});
    }
    std::vector<std::uint8_t> bytes(encoded, encoded + length);
    STBIW_FREE(encoded);
    return bytes;
}

} // namespace VW::Render
