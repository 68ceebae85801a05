#ifndef GEOHASH_INCLUDED_ENGINE
#define GEOHASH_INCLUDED_ENGINE

#include "geohash/base32.hpp"
#include "geohash/bisector.hpp"
#include "geohash/config.hpp"
#include "geohash/interleave.hpp"
#include "geohash/types.hpp"
#include "utility/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

namespace geohash
{

// Hashes are processed in blocks of whole symbols that fit one word. The
// block holds an even number of bits, so every block starts on a longitude
// bit and continues from the cell the previous block left behind.
inline constexpr std::size_t s_block_length = base32::s_max_packed_length;
static_assert((s_block_length * s_bits_per_symbol) % 2 == 0);

inline constexpr int    s_max_suggested_length = engine_config::s_max_default_length;
inline constexpr double s_display_scale        = 1e6;

namespace detail
{

[[nodiscard]]
inline auto round_for_display(double v) noexcept -> double
{
    return std::round(v * s_display_scale) / s_display_scale;
}

/// `center` rounded to 6 decimals when that stays in [min, max) of the cell,
/// otherwise the exact center. No other 6 decimal value can be closer, and
/// keeping clear of `max` means the value encodes back into the same cell.
[[nodiscard]]
inline auto display_value(double center, double min, double max) noexcept -> double
{
    const auto rounded = round_for_display(center);
    return (min <= rounded && rounded < max) ? rounded : center;
}

struct cell
{
    bisector::axis_range lat = bisector::s_latitude_range;
    bisector::axis_range lng = bisector::s_longitude_range;

    [[nodiscard]]
    constexpr auto box() const noexcept -> bounding_box
    {
        return { { lat.min, lng.min }, { lat.max, lng.max } };
    }
};

} // namespace detail

/// Encodes a coordinate into `length` symbols. Out of range coordinates are
/// clamped to [-90, 90] x [-180, 180]. The length is used as given.
[[nodiscard]]
inline auto encode(double lat, double lng, std::size_t length) -> std::string
{
    const auto c = clamp({ lat, lng });
    if (c.lat != lat || c.lng != lng)
    {
        DEFAULT_SOURCE_LOG_TRACE("encode clamped an out of range coordinate");
    }

    detail::cell cell;
    std::string  hash;
    hash.reserve(length);
    for (std::size_t done = 0; done < length; done += s_block_length)
    {
        const auto symbols    = std::min(s_block_length, length - done);
        const auto total_bits = static_cast<unsigned>(symbols * s_bits_per_symbol);
        const auto budget     = interleave::axis_bits(total_bits);

        const auto lng_part = bisector::bisect(c.lng, cell.lng, budget.lng_bits);
        const auto lat_part = bisector::bisect(c.lat, cell.lat, budget.lat_bits);
        cell.lng            = lng_part.range;
        cell.lat            = lat_part.range;

        hash += base32::encode(
            interleave::interleave(
                static_cast<interleave::lane_t>(lng_part.bits),
                static_cast<interleave::lane_t>(lat_part.bits),
                total_bits
            ),
            symbols
        );
    }
    return hash;
}

/// Exact cell a hash denotes. The empty hash denotes the whole world.
/// Throws invalid_character.
[[nodiscard]]
inline auto bounds(std::string_view hash) -> bounding_box
{
    detail::cell cell;
    for (std::size_t done = 0; done < hash.size(); done += s_block_length)
    {
        const auto block      = hash.substr(done, s_block_length);
        const auto total_bits = static_cast<unsigned>(block.size() * s_bits_per_symbol);
        const auto budget     = interleave::axis_bits(total_bits);
        const auto streams =
            interleave::split(base32::decode(block, done), total_bits);

        cell.lng = bisector::narrow(streams.lng, cell.lng, budget.lng_bits);
        cell.lat = bisector::narrow(streams.lat, cell.lat, budget.lat_bits);
    }
    return cell.box();
}

/// Cell center rounded to 6 decimals plus the exact cell.
/// When the rounded value would leave the cell (cells narrower than the
/// rounding step, from length 12) the exact center is kept instead, so
/// `bbox.contains(point)` holds for every length.
/// Any length is accepted. Throws invalid_character.
[[nodiscard]]
inline auto decode(std::string_view hash) -> decoded_hash
{
    const auto bbox   = bounds(hash);
    const auto center = bbox.center();
    return { { detail::display_value(center.lat, bbox.sw.lat, bbox.ne.lat),
               detail::display_value(center.lng, bbox.sw.lng, bbox.ne.lng) },
             bbox };
}

/// Full cell size in degrees per axis for a hash of `length` symbols.
[[nodiscard]]
inline auto angular_error(std::size_t length) noexcept -> coordinate
{
    const auto budget =
        interleave::axis_bits(static_cast<unsigned>(length * s_bits_per_symbol));
    const auto lat_bits = static_cast<int>(budget.lat_bits);
    const auto lng_bits = static_cast<int>(budget.lng_bits);
    return { std::ldexp(bisector::s_latitude_range.width(), -lat_bits),
             std::ldexp(bisector::s_longitude_range.width(), -lng_bits) };
}

/// Worst case positional error in meters: the larger cell side, both axes
/// converted at 111320 m/deg with no latitude correction.
[[nodiscard]]
inline auto precision_meters(std::size_t length) noexcept -> double
{
    const auto err = angular_error(length);
    return std::max(err.lat, err.lng) * s_meters_per_degree;
}

/// Shortest length in 1..12 whose precision is within `target_meters`,
/// 12 when none is.
[[nodiscard]]
inline auto suggest_length_for_precision(double target_meters) noexcept -> int
{
    for (int length = 1; length <= s_max_suggested_length; ++length)
    {
        if (precision_meters(static_cast<std::size_t>(length)) <= target_meters)
        {
            return length;
        }
    }
    return s_max_suggested_length;
}

/// decode() with the box rebuilt from the angular error of the hash length
/// around the cell center, and the precision estimate attached.
/// Past about 18 symbols the bisector cell no longer halves exactly in double
/// precision, and past about 22 it stops shrinking, while the angular error
/// keeps halving. Once the two differ the exact cell from bounds() is
/// returned, so the box never collapses below the cell the point lies in.
[[nodiscard]]
inline auto decode_with_bounding_box(std::string_view hash) -> bounded_hash
{
    const auto decoded = decode(hash);
    const auto center  = decoded.bbox.center();
    const auto err     = angular_error(hash.size());

    const bounding_box derived{
        { center.lat - err.lat / 2.0, center.lng - err.lng / 2.0 },
        { center.lat + err.lat / 2.0, center.lng + err.lng / 2.0 }
    };
    const bool stalled = decoded.bbox.lat_span() != err.lat
                      || decoded.bbox.lng_span() != err.lng;
    return { decoded.point, stalled ? decoded.bbox : derived,
             precision_meters(hash.size()) };
}

/// Immutable facade carrying a default length. Share freely; a different
/// default means a different engine.
class engine
{
public:
    constexpr engine() noexcept = default;
    constexpr explicit engine(engine_config config) noexcept
        : m_config{ config }
    {
    }

    [[nodiscard]]
    auto encode(double lat, double lng) const -> std::string
    {
        return geohash::encode(lat, lng, m_config.default_length());
    }

    [[nodiscard]]
    auto encode(double lat, double lng, std::size_t length) const -> std::string
    {
        return geohash::encode(lat, lng, length);
    }

    [[nodiscard]]
    auto decode(std::string_view hash) const -> decoded_hash
    {
        return geohash::decode(hash);
    }

    [[nodiscard]]
    auto decode_with_bounding_box(std::string_view hash) const -> bounded_hash
    {
        return geohash::decode_with_bounding_box(hash);
    }

    [[nodiscard]]
    constexpr auto config() const noexcept -> engine_config const&
    {
        return m_config;
    }

    [[nodiscard]]
    constexpr auto default_length() const noexcept -> std::size_t
    {
        return m_config.default_length();
    }

private:
    engine_config m_config{};
};

} // namespace geohash

#endif // GEOHASH_INCLUDED_ENGINE
