#include <versewall/poem/PoemProvider.hpp>

#include "core/FileIO.hpp"
#include "log/TaggedLogger.hpp"

namespace VW::Poem {

FilePoemProvider::FilePoemProvider(std::filesystem::path path)
    : path_(std::move(path)) {}

auto FilePoemProvider::fetch() -> Expected<PoemContent> {
    auto text = readTextFile(path_);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parse_poem(*text);
}

auto acquire_poem(PoemProvider* provider, PoemCache const& cache) -> AcquiredPoem {
    if (provider != nullptr) {
        auto fetched = provider->fetch();
        if (fetched) {
            if (auto saved = cache.save(*fetched); !saved) {
                vw_log("Poem cache not updated: " + describeError(saved.error()), "Poem", "Warning");
            }
            vw_log("Poem loaded: " + fetched->origin.title, "Poem");
            return AcquiredPoem{std::move(*fetched), PoemSource::Provider};
        }
        vw_log("Poem provider failed: " + describeError(fetched.error()), "Poem", "Warning");
    }

    if (auto cached = cache.load()) {
        vw_log("Using cached poem: " + cached->origin.title, "Poem");
        return AcquiredPoem{std::move(*cached), PoemSource::Cache};
    }

    vw_log("No poem available, using the built-in one", "Poem");
    return AcquiredPoem{fallback_poem(), PoemSource::Fallback};
}

} // namespace VW::Poem
