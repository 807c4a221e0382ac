#pragma once

#include <cstdint>
#include <string_view>

namespace VW::Effects {

struct DeviceRect {
    std::int32_t left = 0;
    std::int32_t top = 0;
    std::int32_t right = 0;
    std::int32_t bottom = 0;

    [[nodiscard]] auto width() const -> std::int32_t { return right - left; }
    [[nodiscard]] auto height() const -> std::int32_t { return bottom - top; }
    [[nodiscard]] auto empty() const -> bool { return width() <= 0 || height() <= 0; }

    friend auto operator==(DeviceRect const&, DeviceRect const&) -> bool = default;
};

// FNV-1a 32 over the ASCII-lowercased bytes of text. Empty input hashes to 0.
[[nodiscard]] auto stable_hash32(std::string_view text) -> std::uint32_t;

// One FNV-1a step folding a signed value into hash.
[[nodiscard]] auto mix32(std::uint32_t hash, std::int32_t value) -> std::uint32_t;

// Quantizes the variation offset to 1e-5 and folds it with the seed (FNV-1a 64).
[[nodiscard]] auto combine_seed(std::int32_t seed_base, double variation_offset) -> std::uint64_t;

// Base variation for a stored seed, mapped to [0, 2pi).
[[nodiscard]] auto variation_from_seed(std::int32_t seed_base) -> double;

// Per-monitor perturbation in [0, 2pi) from the monitor id and its device rectangle.
[[nodiscard]] auto monitor_variation(std::string_view monitor_id, DeviceRect const& rect) -> double;

// Wraps any finite offset into [0, 2pi).
[[nodiscard]] auto wrap_variation(double offset) -> double;

} // namespace VW::Effects
