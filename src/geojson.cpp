#include "geohash/exporters/geojson.hpp"
#include "geohash/engine.hpp"
#include "utility/logging.hpp"
#include <array>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numbers>
#include <sstream>

namespace geohash::exporters
{

namespace
{

auto write_position(std::ostream& os, coordinate c) -> void
{
    // GeoJSON positions are [longitude, latitude]
    os << '[' << c.lng << ", " << c.lat << ']';
}

auto write_properties(std::ostream& os, std::string_view type, std::string_view hash)
    -> void
{
    os << "            \"properties\": {\n";
    os << "                \"type\": \"" << type << "\",\n";
    os << "                \"hash\": \"" << hash << "\"\n";
    os << "            },\n";
}

auto write_polygon_feature(std::ostream& os, std::string_view hash, bounding_box const& b)
    -> void
{
    const std::array<coordinate, 5> ring = {
        coordinate{ b.sw.lat, b.sw.lng },
        coordinate{ b.sw.lat, b.ne.lng },
        coordinate{ b.ne.lat, b.ne.lng },
        coordinate{ b.ne.lat, b.sw.lng },
        coordinate{ b.sw.lat, b.sw.lng },
    };

    os << "        {\n";
    os << "            \"type\": \"Feature\",\n";
    write_properties(os, "bbox", hash);
    os << "            \"geometry\": {\n";
    os << "                \"type\": \"Polygon\",\n";
    os << "                \"coordinates\": [\n";
    os << "                    [\n";
    for (std::size_t i = 0; i != ring.size(); ++i)
    {
        os << "                        ";
        write_position(os, ring[i]);
        os << (i + 1 != ring.size() ? ",\n" : "\n");
    }
    os << "                    ]\n";
    os << "                ]\n";
    os << "            }\n";
    os << "        }";
}

auto write_point_feature(std::ostream& os, std::string_view hash, coordinate c) -> void
{
    os << "        {\n";
    os << "            \"type\": \"Feature\",\n";
    write_properties(os, "center", hash);
    os << "            \"geometry\": {\n";
    os << "                \"type\": \"Point\",\n";
    os << "                \"coordinates\": ";
    write_position(os, c);
    os << "\n";
    os << "            }\n";
    os << "        }";
}

} // namespace

auto pad(bounding_box bbox, double center_lat, double padding_m) noexcept -> bounding_box
{
    if (!(padding_m > 0.0)) return bbox;

    const auto lat_deg = padding_m / s_meters_per_degree;
    const auto lng_deg =
        padding_m / (s_meters_per_degree * std::cos(center_lat * std::numbers::pi / 180.0));

    bbox.sw.lat -= lat_deg;
    bbox.sw.lng -= lng_deg;
    bbox.ne.lat += lat_deg;
    bbox.ne.lng += lng_deg;
    return bbox;
}

auto write_geojson(std::ostream& os, std::string_view hash, geojson_options const& options)
    -> void
{
    const auto decoded = decode_with_bounding_box(hash);
    const auto bbox    = pad(decoded.bbox, decoded.point.lat, options.padding_m);
    DEFAULT_SOURCE_LOG_TRACE("exporting geojson for " + std::string(hash));

    const auto flags     = os.flags();
    const auto precision = os.precision();
    os << std::setprecision(std::numeric_limits<double>::digits10);

    os << "{\n";
    os << "    \"type\": \"FeatureCollection\",\n";
    os << "    \"features\": [\n";
    write_polygon_feature(os, hash, bbox);
    if (options.include_center)
    {
        os << ",\n";
        write_point_feature(os, hash, decoded.point);
    }
    os << "\n";
    os << "    ]\n";
    os << "}\n";

    os.flags(flags);
    os.precision(precision);
}

auto to_geojson(std::string_view hash, geojson_options const& options) -> std::string
{
    std::ostringstream os;
    write_geojson(os, hash, options);
    return os.str();
}

} // namespace geohash::exporters
