#include <versewall/text/FontFace.hpp>
#include <versewall/text/Utf8.hpp>

#include "log/TaggedLogger.hpp"

#include <hb.h>

namespace VW::Text {
namespace {

struct OutlineSink {
    Scene::PathGeometry* path = nullptr;
    float scale = 1.0f;
    bool open = false;
};

auto to_point(OutlineSink const& sink, float x, float y) -> Scene::Point {
    return Scene::Point{static_cast<double>(x * sink.scale), static_cast<double>(-y * sink.scale)};
}

void on_move_to(hb_draw_funcs_t*, void* data, hb_draw_state_t*, float x, float y, void*) {
    auto& sink = *static_cast<OutlineSink*>(data);
    if (sink.open) {
        sink.path->close();
    }
    sink.path->move_to(to_point(sink, x, y));
    sink.open = true;
}

void on_line_to(hb_draw_funcs_t*, void* data, hb_draw_state_t*, float x, float y, void*) {
    auto& sink = *static_cast<OutlineSink*>(data);
    sink.path->line_to(to_point(sink, x, y));
}

void on_quadratic_to(hb_draw_funcs_t*, void* data, hb_draw_state_t*,
                     float cx, float cy, float x, float y, void*) {
    auto& sink = *static_cast<OutlineSink*>(data);
    sink.path->quad_to(to_point(sink, cx, cy), to_point(sink, x, y));
}

void on_cubic_to(hb_draw_funcs_t*, void* data, hb_draw_state_t*,
                 float c1x, float c1y, float c2x, float c2y, float x, float y, void*) {
    auto& sink = *static_cast<OutlineSink*>(data);
    sink.path->cubic_to(to_point(sink, c1x, c1y), to_point(sink, c2x, c2y), to_point(sink, x, y));
}

void on_close_path(hb_draw_funcs_t*, void* data, hb_draw_state_t*, void*) {
    auto& sink = *static_cast<OutlineSink*>(data);
    sink.path->close();
    sink.open = false;
}

auto outline_funcs() -> hb_draw_funcs_t* {
    static hb_draw_funcs_t* funcs = []() {
        auto* f = hb_draw_funcs_create();
        hb_draw_funcs_set_move_to_func(f, on_move_to, nullptr, nullptr);
        hb_draw_funcs_set_line_to_func(f, on_line_to, nullptr, nullptr);
        hb_draw_funcs_set_quadratic_to_func(f, on_quadratic_to, nullptr, nullptr);
        hb_draw_funcs_set_cubic_to_func(f, on_cubic_to, nullptr, nullptr);
        hb_draw_funcs_set_close_path_func(f, on_close_path, nullptr, nullptr);
        hb_draw_funcs_make_immutable(f);
        return f;
    }();
    return funcs;
}

} // namespace

FontFace::~FontFace() {
    if (font_ != nullptr) {
        hb_font_destroy(font_);
    }
}

auto FontFace::load(std::filesystem::path const& path, unsigned int index) -> Expected<std::shared_ptr<FontFace>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(Error{Error::Code::NotFound, "font file not found: " + path.string()});
    }
    hb_blob_t* blob = hb_blob_create_from_file(path.string().c_str());
    if (hb_blob_get_length(blob) == 0) {
        hb_blob_destroy(blob);
        return std::unexpected(Error{Error::Code::TransientIO, "failed to read font file: " + path.string()});
    }
    if (index >= hb_face_count(blob)) {
        hb_blob_destroy(blob);
        return std::unexpected(Error{Error::Code::NotFound,
                                     "face " + std::to_string(index) + " not in " + path.string()});
    }
    hb_face_t* face = hb_face_create(blob, index);
    hb_blob_destroy(blob);
    if (hb_face_get_glyph_count(face) == 0) {
        hb_face_destroy(face);
        return std::unexpected(Error{Error::Code::MalformedInput, "font has no glyphs: " + path.string()});
    }

    auto result = std::shared_ptr<FontFace>(new FontFace());
    auto upem = hb_face_get_upem(face);
    result->units_per_em_ = upem > 0 ? static_cast<float>(upem) : 1000.0f;
    result->font_ = hb_font_create(face);
    hb_face_destroy(face);
    hb_font_set_scale(result->font_, static_cast<int>(result->units_per_em_), static_cast<int>(result->units_per_em_));

    hb_font_extents_t extents{};
    if (hb_font_get_h_extents(result->font_, &extents)) {
        result->ascender_em_ = static_cast<float>(extents.ascender) / result->units_per_em_;
        result->descender_em_ = static_cast<float>(extents.descender) / result->units_per_em_;
    }
    hb_font_make_immutable(result->font_);
    result->source_ = index == 0 ? path.string() : path.string() + "#" + std::to_string(index);
    vw_log("Loaded font " + result->source_, "Font");
    return result;
}

auto FontFace::placeholder() -> std::shared_ptr<FontFace> {
    auto result = std::shared_ptr<FontFace>(new FontFace());
    result->source_ = "<placeholder>";
    return result;
}

auto FontFace::shape(std::string_view utf8) const -> std::vector<ShapedGlyph> {
    std::vector<ShapedGlyph> glyphs;
    if (font_ == nullptr) {
        auto codepoints = decode_utf8(utf8);
        glyphs.reserve(codepoints.size());
        std::uint32_t cluster = 0;
        for (auto cp : codepoints) {
            auto wide = cp >= 0x2E80;
            glyphs.push_back(ShapedGlyph{static_cast<std::uint32_t>(cp), cluster++, wide ? 1.0f : 0.5f, 0.0f, 0.0f});
        }
        return glyphs;
    }

    hb_buffer_t* buffer = hb_buffer_create();
    hb_buffer_add_utf8(buffer, utf8.data(), static_cast<int>(utf8.size()), 0, static_cast<int>(utf8.size()));
    hb_buffer_guess_segment_properties(buffer);
    hb_buffer_set_direction(buffer, HB_DIRECTION_LTR);
    hb_shape(font_, buffer, nullptr, 0);

    unsigned int glyph_count = hb_buffer_get_length(buffer);
    auto infos = hb_buffer_get_glyph_infos(buffer, nullptr);
    auto positions = hb_buffer_get_glyph_positions(buffer, nullptr);
    glyphs.reserve(glyph_count);
    for (unsigned int i = 0; i < glyph_count; ++i) {
        glyphs.push_back(ShapedGlyph{
            infos[i].codepoint,
            infos[i].cluster,
            static_cast<float>(positions[i].x_advance) / units_per_em_,
            static_cast<float>(positions[i].x_offset) / units_per_em_,
            -static_cast<float>(positions[i].y_offset) / units_per_em_,
        });
    }
    hb_buffer_destroy(buffer);
    return glyphs;
}

auto FontFace::advance_em(std::string_view utf8) const -> float {
    float total = 0.0f;
    for (auto const& glyph : shape(utf8)) {
        total += glyph.x_advance;
    }
    return total;
}

auto FontFace::outline(std::uint32_t glyph_id) const -> Scene::PathGeometry {
    if (font_ == nullptr) {
        return {};
    }
    {
        std::lock_guard<std::mutex> lock(outline_mutex_);
        if (auto it = outlines_.find(glyph_id); it != outlines_.end()) {
            return it->second;
        }
    }
    Scene::PathGeometry path;
    OutlineSink sink{&path, 1.0f / units_per_em_, false};
    hb_font_get_glyph_shape(font_, glyph_id, outline_funcs(), &sink);
    if (sink.open) {
        path.close();
    }
    std::lock_guard<std::mutex> lock(outline_mutex_);
    outlines_.emplace(glyph_id, path);
    return path;
}

} // namespace VW::Text
