#include <versewall/settings/EntropySource.hpp>
#include <versewall/settings/SettingsStore.hpp>

#include "log/TaggedLogger.hpp"

#include <random>
#include <string>

namespace VW::Settings {

auto SystemEntropy::next_u32() -> std::uint32_t {
    std::random_device device;
    return static_cast<std::uint32_t>(device());
}

auto draw_seed(EntropySource& entropy) -> std::int32_t {
    auto value = static_cast<std::int32_t>(entropy.next_u32() & 0x7FFFFFFFu);
    return value == 0 ? 1 : value;
}

auto ensure_seed(SettingsStore& store, EntropySource& entropy) -> Expected<std::int32_t> {
    auto current = store.snapshot().background_seed;
    if (current != 0) {
        return current;
    }
    auto seed = draw_seed(entropy);
    auto updated = store.update([seed](AppSettings& settings) { settings.background_seed = seed; });
    vw_log("Background seed chosen: " + std::to_string(seed), "Settings");
    if (!updated) {
        return std::unexpected(updated.error());
    }
    return seed;
}

} // namespace VW::Settings
