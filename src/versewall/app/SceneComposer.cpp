#include <versewall/app/SceneComposer.hpp>

#include "log/TaggedLogger.hpp"

#include <versewall/text/FontFace.hpp>

namespace VW::App {

namespace {

auto family_key(std::string_view family) -> std::string {
    std::string key(family);
    for (auto& c : key) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return key;
}

} // namespace

FontLibrary::FontLibrary()
    : FontLibrary(Text::resolve_font_file) {}

FontLibrary::FontLibrary(Resolver resolver)
    : resolver_(std::move(resolver)) {}

auto FontLibrary::register_face(std::string family, std::shared_ptr<Text::FontFace const> face) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.insert_or_assign(family_key(family), std::move(face));
}

auto FontLibrary::face(FontSpec const& spec, std::string_view sample) -> Expected<std::shared_ptr<Text::FontFace const>> {
    auto key = spec.file + '\n' + family_key(spec.family);
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = faces_.find(key); it != faces_.end()) {
        return it->second;
    }
    auto resolved = resolve_locked(spec, sample);
    if (!resolved) {
        vw_log("No font for family '" + spec.family + "': " + describeError(resolved.error()), "Render", "Warning");
        return resolved;
    }
    faces_.emplace(std::move(key), *resolved);
    return resolved;
}

auto FontLibrary::resolve_locked(FontSpec const& spec, std::string_view sample) -> Expected<std::shared_ptr<Text::FontFace const>> {
    if (!spec.file.empty()) {
        if (auto loaded = Text::FontFace::load(spec.file)) {
            return std::shared_ptr<Text::FontFace const>(std::move(*loaded));
        } else {
            vw_log("Font file " + spec.file + " unavailable (" + describeError(loaded.error()) + "), trying the family",
                   "Render", "Warning");
        }
    }
    if (auto it = registered_.find(family_key(spec.family)); it != registered_.end()) {
        return it->second;
    }
    if (!resolver_) {
        return std::unexpected(Error{Error::Code::NotSupported, "no font resolver"});
    }
    auto file = resolver_(Text::FontQuery{spec.family, Text::default_fallback_families(), std::string(sample)});
    if (!file) {
        return std::unexpected(file.error());
    }
    auto loaded = Text::FontFace::load(file->path, file->index);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    return std::shared_ptr<Text::FontFace const>(std::move(*loaded));
}

auto compose_scene_inputs(Settings::AppSettings const& settings, CompositionContext const& context)
        -> Expected<Scene::SceneInputs> {
    Scene::SceneInputs inputs;
    inputs.poem = Poem::to_poem_text(context.poem, settings.show_full_poem);

    auto poem_font = context.fonts.face(FontSpec{settings.poem_font_file, settings.poem_font_family},
                                        inputs.poem.main_text);
    if (!poem_font) {
        return std::unexpected(poem_font.error());
    }
    auto author_font = context.fonts.face(FontSpec{settings.author_font_file, settings.author_font_family},
                                          inputs.poem.title + inputs.poem.author);
    if (!author_font) {
        return std::unexpected(author_font.error());
    }

    auto& style = inputs.style;
    style.orientation          = settings.orientation;
    style.vertical_alignment   = settings.vertical_alignment;
    style.horizontal_alignment = settings.horizontal_alignment;
    style.poem_font            = std::move(*poem_font);
    style.author_font          = std::move(*author_font);
    style.poem_font_size       = static_cast<float>(settings.poem_font_size);
    style.author_font_size     = static_cast<float>(settings.author_font_size);
    style.line_spacing               = static_cast<float>(settings.line_spacing);
    style.character_spacing          = static_cast<float>(settings.character_spacing);
    style.vertical_character_spacing = static_cast<float>(settings.vertical_character_spacing);
    style.vertical_footer_offset     = static_cast<float>(settings.vertical_footer_offset);
    style.horizontal_footer_offset   = static_cast<float>(settings.horizontal_footer_offset);

    inputs.background   = context.theme.background;
    inputs.dark_theme   = context.theme.dark;
    inputs.effect       = settings.background_effect;
    inputs.effect_color = context.theme.effect_color;
    inputs.seed         = settings.background_seed;

    if (settings.show_traditional_color_name) {
        inputs.watermark = context.palette.name_for(settings.wave_color);
    }
    return inputs;
}

} // namespace VW::App
