#pragma once

#include "core/Error.hpp"

#include <versewall/poem/PoemContent.hpp>
#include <versewall/scene/SceneInputs.hpp>
#include <versewall/settings/AppSettings.hpp>
#include <versewall/settings/ThemeResolver.hpp>
#include <versewall/text/FontResolver.hpp>
#include <versewall/theme/TraditionalColorPalette.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace VW::Text {
class FontFace;
}

namespace VW::App {

struct FontSpec {
    std::string file;
    std::string family;
};

/**
 * Loaded font faces keyed by file and family.
 *
 * face() tries the file first, then a registered family, then the resolver
 * (fontconfig by default) with the CJK fallback families. A spec that
 * resolves to nothing is an error; nothing is drawn with an empty face.
 */
class FontLibrary {
public:
    using Resolver = std::function<Expected<Text::ResolvedFontFile>(Text::FontQuery const&)>;

    FontLibrary();
    explicit FontLibrary(Resolver resolver);

    // sample is the text the face will draw; it steers the fallback choice.
    auto face(FontSpec const& spec, std::string_view sample) -> Expected<std::shared_ptr<Text::FontFace const>>;
    // A registered family is used before asking the resolver.
    auto register_face(std::string family, std::shared_ptr<Text::FontFace const> face) -> void;

private:
    auto resolve_locked(FontSpec const& spec, std::string_view sample) -> Expected<std::shared_ptr<Text::FontFace const>>;

    Resolver                                                                 resolver_;
    std::mutex                                                               mutex_;
    phmap::flat_hash_map<std::string, std::shared_ptr<Text::FontFace const>> faces_;
    phmap::flat_hash_map<std::string, std::shared_ptr<Text::FontFace const>> registered_;
};

// Everything the composer reads besides the settings themselves.
struct CompositionContext {
    Poem::PoemContent const&              poem;
    Settings::ResolvedTheme const&        theme;
    Theme::TraditionalColorPalette const& palette;
    FontLibrary&                          fonts;
};

// Maps a settings snapshot and the current poem onto scene inputs. The
// watermark is the palette name of the effect color, when enabled and known.
// Fails when either font cannot be resolved.
auto compose_scene_inputs(Settings::AppSettings const& settings, CompositionContext const& context)
        -> Expected<Scene::SceneInputs>;

} // namespace VW::App
