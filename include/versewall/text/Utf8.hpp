#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace VW::Text {

// Decodes UTF-8; malformed sequences become U+FFFD.
[[nodiscard]] auto decode_utf8(std::string_view text) -> std::u32string;

[[nodiscard]] auto encode_utf8(char32_t codepoint) -> std::string;
[[nodiscard]] auto encode_utf8(std::u32string_view text) -> std::string;

// Trims ASCII whitespace and U+3000 from both ends.
[[nodiscard]] auto trim(std::u32string_view text) -> std::u32string_view;

} // namespace VW::Text
