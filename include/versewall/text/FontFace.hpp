#pragma once

#include "core/Error.hpp"

#include <versewall/scene/DrawCommands.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

struct hb_font_t;

namespace VW::Text {

struct ShapedGlyph {
    std::uint32_t glyph_id = 0;
    std::uint32_t cluster = 0;
    // Em units; multiply by the font size for logical units.
    float x_advance = 0.0f;
    float x_offset = 0.0f;
    float y_offset = 0.0f;
};

/**
 * A loaded font face backed by HarfBuzz.
 *
 * Shaping and outlines are reported in em units so one face can be drawn at
 * any size. Outlines are y-down and cached per glyph id. A face without font
 * data (see placeholder()) still measures text, one em per codepoint, but has
 * no outlines.
 */
class FontFace {
public:
    ~FontFace();

    FontFace(FontFace const&) = delete;
    auto operator=(FontFace const&) -> FontFace& = delete;

    // index selects the face inside a collection (.ttc).
    [[nodiscard]] static auto load(std::filesystem::path const& path, unsigned int index = 0) -> Expected<std::shared_ptr<FontFace>>;
    [[nodiscard]] static auto placeholder() -> std::shared_ptr<FontFace>;

    [[nodiscard]] auto shape(std::string_view utf8) const -> std::vector<ShapedGlyph>;
    [[nodiscard]] auto advance_em(std::string_view utf8) const -> float;
    [[nodiscard]] auto outline(std::uint32_t glyph_id) const -> Scene::PathGeometry;

    [[nodiscard]] auto ascender_em() const -> float { return ascender_em_; }
    [[nodiscard]] auto descender_em() const -> float { return descender_em_; }
    [[nodiscard]] auto has_outlines() const -> bool { return font_ != nullptr; }
    [[nodiscard]] auto source() const -> std::string const& { return source_; }

private:
    FontFace() = default;

    hb_font_t* font_ = nullptr;
    float units_per_em_ = 1000.0f;
    float ascender_em_ = 0.88f;
    float descender_em_ = -0.12f;
    std::string source_;

    mutable std::mutex outline_mutex_;
    mutable phmap::flat_hash_map<std::uint32_t, Scene::PathGeometry> outlines_;
};

} // namespace VW::Text
