#pragma once

#include <cstdint>
#include <random>

namespace VW::Effects {

/**
 * Seeded random stream with platform-independent output.
 *
 * std::mt19937_64 is fully specified by the standard, the distributions are
 * not, so conversions to double and integer ranges are done here by hand.
 */
class DeterministicRng {
public:
    explicit DeterministicRng(std::uint64_t seed)
        : engine_(seed) {}

    // Uniform in [0, 1).
    auto next_double() -> double {
        return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
    }

    // Uniform in [min_inclusive, max_exclusive); returns min_inclusive for empty ranges.
    auto next_int(int min_inclusive, int max_exclusive) -> int {
        if (max_exclusive <= min_inclusive) {
            return min_inclusive;
        }
        auto span = static_cast<double>(max_exclusive - min_inclusive);
        auto offset = static_cast<int>(next_double() * span);
        return min_inclusive + offset;
    }

    auto next_range(double lo, double hi) -> double {
        return lo + (hi - lo) * next_double();
    }

private:
    std::mt19937_64 engine_;
};

} // namespace VW::Effects
