#include <doctest/doctest.h>

#include <versewall/text/FontFace.hpp>
#include <versewall/text/Utf8.hpp>
#include <versewall/text/VerticalGlyphMap.hpp>

using namespace VW::Text;

TEST_SUITE("text.utf8") {

TEST_CASE("decode and encode mixed scripts") {
    std::string text = "春眠 dawn\xF0\x9F\x8C\xB8";
    auto decoded = decode_utf8(text);
    REQUIRE(decoded.size() == 8);
    CHECK(decoded[0] == U'春');
    CHECK(decoded[2] == U' ');
    CHECK(decoded[7] == char32_t{0x1F338});
    CHECK(encode_utf8(decoded) == text);
}

TEST_CASE("malformed bytes become replacement characters") {
    auto decoded = decode_utf8("a\xFF" "b");
    REQUIRE(decoded.size() == 3);
    CHECK(decoded[1] == char32_t{0xFFFD});

    auto truncated = decode_utf8("x\xE6\x98");
    REQUIRE(truncated.size() == 2);
    CHECK(truncated[1] == char32_t{0xFFFD});

    auto bad_continuation = decode_utf8("\xE6" "ab");
    CHECK(bad_continuation == U"\xFFFD" U"ab");

    CHECK(encode_utf8(char32_t{0x110000}) == "\xEF\xBF\xBD");
}

TEST_CASE("trim removes ideographic space") {
    CHECK(trim(U"　 床前 \n") == U"床前");
    CHECK(trim(U"   ").empty());
    CHECK(trim(U"") == U"");
}

}

TEST_SUITE("text.vertical") {

TEST_CASE("punctuation maps to vertical forms") {
    CHECK(vertical_form(U'，') == U'︐');
    CHECK(vertical_form(U'。') == U'︒');
    CHECK(vertical_form(U'「') == U'﹁');
    CHECK(vertical_form(U'《') == U'︽');
    CHECK(vertical_form(U'…') == U'︙');
    CHECK(vertical_form(U'月') == U'月');
    CHECK(vertical_form(U'a') == U'a');
}

}

TEST_SUITE("text.font") {

TEST_CASE("placeholder face measures without outlines") {
    auto face = FontFace::placeholder();
    CHECK_FALSE(face->has_outlines());
    CHECK(face->source() == "<placeholder>");
    CHECK(face->advance_em("明月") == doctest::Approx(2.0f));
    CHECK(face->advance_em("ab") == doctest::Approx(1.0f));
    auto glyphs = face->shape("月a");
    REQUIRE(glyphs.size() == 2);
    CHECK(glyphs[0].glyph_id == U'月');
    CHECK(glyphs[1].cluster == 1);
    CHECK(face->outline(glyphs[0].glyph_id).empty());
    CHECK(face->ascender_em() - face->descender_em() == doctest::Approx(1.0f));
}

TEST_CASE("loading a missing font reports an error") {
    auto face = FontFace::load("/nonexistent/versewall/font.ttf");
    CHECK_FALSE(face.has_value());
}

}
