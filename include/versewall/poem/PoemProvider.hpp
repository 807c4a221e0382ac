#pragma once

#include "core/Error.hpp"

#include <versewall/poem/PoemCache.hpp>
#include <versewall/poem/PoemContent.hpp>

#include <filesystem>

namespace VW::Poem {

// Source of fresh poems. Network acquisition lives behind this seam.
class PoemProvider {
public:
    virtual ~PoemProvider() = default;
    virtual auto fetch() -> Expected<PoemContent> = 0;
};

// Reads a poem (or a service response) from a JSON file on every fetch.
class FilePoemProvider final : public PoemProvider {
public:
    explicit FilePoemProvider(std::filesystem::path path);
    auto fetch() -> Expected<PoemContent> override;

private:
    std::filesystem::path path_;
};

enum class PoemSource {
    Provider,
    Cache,
    Fallback,
};

struct AcquiredPoem {
    PoemContent poem;
    PoemSource  source = PoemSource::Fallback;
};

// Provider first (and refresh the cache), then the cache, then fallback_poem().
auto acquire_poem(PoemProvider* provider, PoemCache const& cache) -> AcquiredPoem;

} // namespace VW::Poem
