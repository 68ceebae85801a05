#ifndef GEOHASH_INCLUDED_TYPES
#define GEOHASH_INCLUDED_TYPES

#include <algorithm>
#include <cstddef>

namespace geohash
{

inline constexpr double s_min_latitude  = -90.0;
inline constexpr double s_max_latitude  = 90.0;
inline constexpr double s_min_longitude = -180.0;
inline constexpr double s_max_longitude = 180.0;

// Flat conversion, identical for both axes. Exporters that need a metric
// longitude apply their own cos(lat) correction.
inline constexpr double s_meters_per_degree = 111'320.0;

inline constexpr std::size_t s_bits_per_symbol = 5;

struct coordinate
{
    double lat{};
    double lng{};

    auto operator==(coordinate const&) const noexcept -> bool = default;
};

[[nodiscard]]
constexpr auto clamp(coordinate c) noexcept -> coordinate
{
    return { std::clamp(c.lat, s_min_latitude, s_max_latitude),
             std::clamp(c.lng, s_min_longitude, s_max_longitude) };
}

/// Rectangular cell denoted by a hash. sw <= ne on both axes.
struct bounding_box
{
    coordinate sw{};
    coordinate ne{};

    [[nodiscard]]
    constexpr auto center() const noexcept -> coordinate
    {
        return { sw.lat + (ne.lat - sw.lat) / 2.0, sw.lng + (ne.lng - sw.lng) / 2.0 };
    }

    [[nodiscard]]
    constexpr auto lat_span() const noexcept -> double
    {
        return ne.lat - sw.lat;
    }

    [[nodiscard]]
    constexpr auto lng_span() const noexcept -> double
    {
        return ne.lng - sw.lng;
    }

    [[nodiscard]]
    constexpr auto area() const noexcept -> double
    {
        return lat_span() * lng_span();
    }

    [[nodiscard]]
    constexpr auto contains(coordinate c) const noexcept -> bool
    {
        return sw.lat <= c.lat && c.lat <= ne.lat && sw.lng <= c.lng && c.lng <= ne.lng;
    }

    auto operator==(bounding_box const&) const noexcept -> bool = default;
};

struct decoded_hash
{
    coordinate   point{}; // cell center rounded to 6 decimals
    bounding_box bbox{};  // exact cell bounds
};

struct bounded_hash
{
    coordinate   point{};
    bounding_box bbox{};
    double       precision_m{};
};

} // namespace geohash

#endif // GEOHASH_INCLUDED_TYPES
