#pragma once

#include "core/Error.hpp"

#include <versewall/scene/SceneInputs.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace VW::Poem {

struct PoemOrigin {
    std::string              title;
    std::string              author;
    std::string              dynasty;
    std::vector<std::string> content;

    friend auto operator==(PoemOrigin const&, PoemOrigin const&) -> bool = default;
};

// One poem as delivered by the poem service: the featured excerpt plus the
// full work it was taken from.
struct PoemContent {
    std::string content;
    PoemOrigin  origin;

    friend auto operator==(PoemContent const&, PoemContent const&) -> bool = default;
};

// The full poem (trimmed, blank lines dropped, joined by '\n') when requested
// and available; the excerpt otherwise.
auto main_text(PoemContent const& poem, bool show_full_poem) -> std::string;

auto to_poem_text(PoemContent const& poem, bool show_full_poem) -> Scene::PoemText;

// Shown when neither the provider nor the cache has anything.
auto fallback_poem() -> PoemContent;

auto poem_to_json(PoemContent const& poem) -> nlohmann::json;
// Accepts the bare poem object or a service response wrapping it in "data".
auto poem_from_json(nlohmann::json const& document) -> Expected<PoemContent>;
auto parse_poem(std::string_view text) -> Expected<PoemContent>;

} // namespace VW::Poem
