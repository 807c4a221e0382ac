#pragma once

#include "core/Error.hpp"

#include <cstdint>

namespace VW::Settings {

class SettingsStore;

// The only place nondeterminism enters the program.
class EntropySource {
public:
    virtual ~EntropySource() = default;
    virtual auto next_u32() -> std::uint32_t = 0;
};

// std::random_device backed.
class SystemEntropy final : public EntropySource {
public:
    auto next_u32() -> std::uint32_t override;
};

// Draws a positive seed (never 0).
auto draw_seed(EntropySource& entropy) -> std::int32_t;

// Picks and persists a seed when the store has none. Returns the seed in use.
auto ensure_seed(SettingsStore& store, EntropySource& entropy) -> Expected<std::int32_t>;

} // namespace VW::Settings
