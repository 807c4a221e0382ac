#include <versewall/text/VerticalGlyphMap.hpp>

#include <parallel_hashmap/phmap.h>

namespace VW::Text {
namespace {

auto vertical_table() -> phmap::flat_hash_map<char32_t, char32_t> const& {
    static phmap::flat_hash_map<char32_t, char32_t> const table{
        {U'，', U'︐'}, {U'、', U'︑'}, {U'。', U'︒'}, {U'：', U'︓'},
        {U'；', U'︔'}, {U'！', U'︕'}, {U'？', U'︖'},
        {U'「', U'﹁'}, {U'」', U'﹂'}, {U'『', U'﹃'}, {U'』', U'﹄'},
        {U'（', U'︵'}, {U'）', U'︶'}, {U'《', U'︽'}, {U'》', U'︾'},
        {U'〈', U'︿'}, {U'〉', U'﹀'}, {U'【', U'︻'}, {U'】', U'︼'},
        {U'〔', U'︹'}, {U'〕', U'︺'}, {U'〖', U'︗'}, {U'〗', U'︘'},
        {U'…', U'︙'}, {U'—', U'︱'}, {U'–', U'︲'},
        {U'“', U'﹁'}, {U'”', U'﹂'}, {U'‘', U'﹃'}, {U'’', U'﹄'},
        {U'｛', U'︷'}, {U'｝', U'︸'},
    };
    return table;
}

} // namespace

auto vertical_form(char32_t codepoint) -> char32_t {
    auto const& table = vertical_table();
    auto it = table.find(codepoint);
    return it == table.end() ? codepoint : it->second;
}

} // namespace VW::Text
