#include <versewall/poem/PoemCache.hpp>

#include "core/FileIO.hpp"

#include <span>
#include <string>

namespace VW::Poem {

PoemCache::PoemCache(std::filesystem::path path)
    : path_(std::move(path)) {}

auto PoemCache::load() const -> Expected<PoemContent> {
    auto text = readTextFile(path_);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parse_poem(*text);
}

auto PoemCache::save(PoemContent const& poem) const -> Expected<void> {
    auto text = poem_to_json(poem).dump();
    return writer_.write(path_, std::span<std::uint8_t const>(reinterpret_cast<std::uint8_t const*>(text.data()), text.size()));
}

} // namespace VW::Poem
