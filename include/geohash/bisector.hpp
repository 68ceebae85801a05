#ifndef GEOHASH_INCLUDED_BISECTOR
#define GEOHASH_INCLUDED_BISECTOR

#include "geohash/types.hpp"
#include <algorithm>
#include <cassert>
#include <cstdint>

namespace geohash::bisector
{

using bits_t = uint64_t;

inline constexpr unsigned s_max_bits = 64;

struct axis_range
{
    double min{};
    double max{};

    [[nodiscard]]
    constexpr auto mid() const noexcept -> double
    {
        return min + (max - min) / 2.0;
    }

    [[nodiscard]]
    constexpr auto width() const noexcept -> double
    {
        return max - min;
    }

    auto operator==(axis_range const&) const noexcept -> bool = default;
};

inline constexpr axis_range s_latitude_range{ s_min_latitude, s_max_latitude };
inline constexpr axis_range s_longitude_range{ s_min_longitude, s_max_longitude };

struct bisection
{
    bits_t     bits{};
    axis_range range{};
};

/// Binary search encoding of `value` within `range`: bit i is 1 iff the value
/// lies in the upper half after i halvings. A value on the midpoint goes up.
/// The returned range is the cell the bits denote.
[[nodiscard]]
constexpr auto bisect(double value, axis_range range, unsigned n) noexcept -> bisection
{
    assert(n <= s_max_bits && "bit budget exceeds word size");
    value       = std::clamp(value, range.min, range.max);
    bits_t bits = 0;
    for (unsigned i = 0; i != n; ++i)
    {
        const auto mid = range.mid();
        bits <<= 1;
        if (value >= mid)
        {
            bits |= 1;
            range.min = mid;
        }
        else
        {
            range.max = mid;
        }
    }
    return { bits, range };
}

/// Inverse of bisect: replays the low `n` bits, most significant first, and
/// returns the remaining cell. n == 0 returns `range` unchanged.
[[nodiscard]]
constexpr auto narrow(bits_t bits, axis_range range, unsigned n) noexcept -> axis_range
{
    assert(n <= s_max_bits && "bit budget exceeds word size");
    for (unsigned i = 0; i != n; ++i)
    {
        const auto mid  = range.mid();
        const auto mask = bits_t{ 1 } << (n - 1 - i);
        if ((bits & mask) != 0)
        {
            range.min = mid;
        }
        else
        {
            range.max = mid;
        }
    }
    return range;
}

} // namespace geohash::bisector

#endif // GEOHASH_INCLUDED_BISECTOR
