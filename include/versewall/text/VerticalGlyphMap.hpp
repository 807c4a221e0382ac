#pragma once

namespace VW::Text {

// Vertical presentation form for CJK punctuation, brackets and quotes;
// other codepoints are returned unchanged.
[[nodiscard]] auto vertical_form(char32_t codepoint) -> char32_t;

} // namespace VW::Text
