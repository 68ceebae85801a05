#ifndef GEOHASH_INCLUDED_INTERLEAVE
#define GEOHASH_INCLUDED_INTERLEAVE

#include <cassert>
#include <cstdint>
#include <libmorton/morton.h>

namespace geohash::interleave
{

using word_t = uint64_t;
using lane_t = uint_fast32_t;

inline constexpr unsigned s_max_total_bits = 64;

/// Per-axis bit budget for a hash of `total_bits`. Longitude is emitted
/// first and takes the extra bit when the total is odd.
struct axis_budget
{
    unsigned lng_bits{};
    unsigned lat_bits{};
};

[[nodiscard]]
constexpr auto axis_bits(unsigned total_bits) noexcept -> axis_budget
{
    return { total_bits - total_bits / 2, total_bits / 2 };
}

struct axis_streams
{
    lane_t lng{};
    lane_t lat{};

    auto operator==(axis_streams const&) const noexcept -> bool = default;
};

// libmorton puts its first operand on the even lanes (bit 0, 2, ...). The
// most significant of `total_bits` sits on lane total_bits - 1 and must be a
// longitude bit, so longitude rides the even lanes exactly when the total is
// odd.
[[nodiscard]]
constexpr auto longitude_on_even_lanes(unsigned total_bits) noexcept -> bool
{
    return total_bits % 2 == 1;
}

/// Merges the streams into `total_bits` bits, most significant first:
/// lng, lat, lng, lat, ...
[[nodiscard]]
inline auto interleave(lane_t lng, lane_t lat, unsigned total_bits) -> word_t
{
    assert(total_bits <= s_max_total_bits && "interleave capacity exceeded");
    if (longitude_on_even_lanes(total_bits))
    {
        return libmorton::morton2D_64_encode(lng, lat);
    }
    return libmorton::morton2D_64_encode(lat, lng);
}

/// Inverse of interleave for the same `total_bits`.
[[nodiscard]]
inline auto split(word_t bits, unsigned total_bits) -> axis_streams
{
    assert(total_bits <= s_max_total_bits && "interleave capacity exceeded");
    axis_streams streams;
    if (longitude_on_even_lanes(total_bits))
    {
        libmorton::morton2D_64_decode(bits, streams.lng, streams.lat);
    }
    else
    {
        libmorton::morton2D_64_decode(bits, streams.lat, streams.lng);
    }
    return streams;
}

} // namespace geohash::interleave

#endif // GEOHASH_INCLUDED_INTERLEAVE
