#ifndef GEOHASH_INCLUDED_EXPORTERS_GEOJSON
#define GEOHASH_INCLUDED_EXPORTERS_GEOJSON

#include "geohash/types.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace geohash::exporters
{

struct geojson_options
{
    bool   include_center = true;
    double padding_m{}; // applied when > 0
};

/// Grows `bbox` by `padding_m` on every side. Latitude converts at
/// 111320 m/deg, longitude additionally divides by cos(center_lat).
[[nodiscard]]
auto pad(bounding_box bbox, double center_lat, double padding_m) noexcept -> bounding_box;

/// Writes a FeatureCollection holding the cell polygon of `hash` and,
/// optionally, its center point. Throws invalid_character.
auto write_geojson(std::ostream& os, std::string_view hash, geojson_options const& options)
    -> void;

[[nodiscard]]
auto to_geojson(std::string_view hash, geojson_options const& options = {}) -> std::string;

} // namespace geohash::exporters

#endif // GEOHASH_INCLUDED_EXPORTERS_GEOJSON
