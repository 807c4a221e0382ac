#include <versewall/text/Utf8.hpp>

namespace VW::Text {
namespace {

constexpr char32_t kReplacement = 0xFFFD;

auto is_continuation(unsigned char byte) -> bool {
    return (byte & 0xC0u) == 0x80u;
}

auto is_space(char32_t c) -> bool {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v' || c == 0x3000;
}

} // namespace

auto decode_utf8(std::string_view text) -> std::u32string {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        char32_t codepoint = 0;
        if (lead < 0x80u) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0u) == 0xC0u) {
            length = 2;
            codepoint = lead & 0x1Fu;
        } else if ((lead & 0xF0u) == 0xE0u) {
            length = 3;
            codepoint = lead & 0x0Fu;
        } else if ((lead & 0xF8u) == 0xF0u) {
            length = 4;
            codepoint = lead & 0x07u;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        if (i + length > text.size()) {
            out.push_back(kReplacement);
            break;
        }
        bool valid = true;
        for (std::size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation(byte)) {
                valid = false;
                break;
            }
            codepoint = (codepoint << 6) | (byte & 0x3Fu);
        }
        if (!valid) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(codepoint);
        i += length;
    }
    return out;
}

auto encode_utf8(char32_t cp) -> std::string {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        return encode_utf8(kReplacement);
    }
    return out;
}

auto encode_utf8(std::u32string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() * 3);
    for (auto cp : text) {
        out += encode_utf8(cp);
    }
    return out;
}

auto trim(std::u32string_view text) -> std::u32string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace VW::Text
