#include <versewall/effects/Variation.hpp>

#include <cmath>
#include <limits>
#include <numbers>

namespace VW::Effects {
namespace {

constexpr std::uint32_t kFnv32Offset = 2166136261u;
constexpr std::uint32_t kFnv32Prime = 16777619u;
constexpr std::uint64_t kFnv64Offset = 1469598103934665603ull;
constexpr std::uint64_t kFnv64Prime = 1099511628211ull;

auto fnv_mix(std::uint64_t hash, std::uint32_t value) -> std::uint64_t {
    for (int i = 0; i < 4; ++i) {
        hash ^= static_cast<std::uint64_t>((value >> (i * 8)) & 0xFFu);
        hash *= kFnv64Prime;
    }
    return hash;
}

auto to_turn(std::uint32_t value) -> double {
    return static_cast<double>(value) / static_cast<double>(std::numeric_limits<std::uint32_t>::max());
}

} // namespace

auto stable_hash32(std::string_view text) -> std::uint32_t {
    if (text.empty()) {
        return 0;
    }
    std::uint32_t hash = kFnv32Offset;
    for (auto ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<unsigned char>(c - 'A' + 'a');
        }
        hash ^= c;
        hash *= kFnv32Prime;
    }
    return hash;
}

auto mix32(std::uint32_t hash, std::int32_t value) -> std::uint32_t {
    hash ^= static_cast<std::uint32_t>(value);
    hash *= kFnv32Prime;
    return hash;
}

auto combine_seed(std::int32_t seed_base, double variation_offset) -> std::uint64_t {
    auto quantized = static_cast<std::int32_t>(wrap_variation(variation_offset) * 100000.0);
    auto hash = kFnv64Offset;
    hash = fnv_mix(hash, static_cast<std::uint32_t>(seed_base));
    hash = fnv_mix(hash, static_cast<std::uint32_t>(quantized));
    return hash;
}

auto variation_from_seed(std::int32_t seed_base) -> double {
    return wrap_variation(to_turn(static_cast<std::uint32_t>(seed_base)) * 2.0 * std::numbers::pi);
}

auto monitor_variation(std::string_view monitor_id, DeviceRect const& rect) -> double {
    auto hash = stable_hash32(monitor_id);
    hash = mix32(hash, rect.left);
    hash = mix32(hash, rect.top);
    hash = mix32(hash, rect.right);
    hash = mix32(hash, rect.bottom);
    return wrap_variation(to_turn(hash) * 2.0 * std::numbers::pi);
}

auto wrap_variation(double offset) -> double {
    constexpr double two_pi = 2.0 * std::numbers::pi;
    if (!std::isfinite(offset)) {
        return 0.0;
    }
    auto wrapped = std::fmod(offset, two_pi);
    if (wrapped < 0.0) {
        wrapped += two_pi;
    }
    if (wrapped >= two_pi) {
        wrapped = 0.0;
    }
    return wrapped;
}

} // namespace VW::Effects
