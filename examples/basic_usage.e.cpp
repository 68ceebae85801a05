#include "geohash/engine.hpp"
#include "geohash/errors.hpp"
#include "geohash/exporters/geojson.hpp"
#include "geohash/exporters/url.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>

int main()
{
    const geohash::engine engine{ geohash::engine_config{}.with_default_length(7) };

    // Singapore
    const double lat  = 1.3521;
    const double lng  = 103.8198;
    const auto   hash = engine.encode(lat, lng);
    std::cout << "Encoded (" << lat << ", " << lng << ") -> " << hash << '\n';

    const auto decoded = engine.decode(hash);
    std::cout << std::fixed << std::setprecision(6) << "Decoded " << hash << " -> ("
              << decoded.point.lat << ", " << decoded.point.lng << ")\n"
              << "  sw (" << decoded.bbox.sw.lat << ", " << decoded.bbox.sw.lng << ")\n"
              << "  ne (" << decoded.bbox.ne.lat << ", " << decoded.bbox.ne.lng << ")\n"
              << std::defaultfloat;

    std::cout << "\nPrecision per length:\n";
    for (std::size_t length = 1; length <= 12; ++length)
    {
        std::cout << "  " << std::setw(2) << length << ": " << std::setw(12)
                  << std::fixed << std::setprecision(2)
                  << geohash::precision_meters(length) << " m  "
                  << engine.encode(lat, lng, length) << '\n';
    }
    std::cout << std::defaultfloat;

    std::cout << "\nLength for 5 m: " << geohash::suggest_length_for_precision(5.0)
              << '\n';

    std::cout << "\nURL: " << geohash::exporters::to_url(hash, "https://maps.example.com/")
              << '\n';

    std::cout << "\nGeoJSON with 100 m padding:\n";
    geohash::exporters::write_geojson(std::cout, hash, { .padding_m = 100.0 });

    try
    {
        [[maybe_unused]] auto bad = engine.decode("invalid@hash");
    }
    catch (geohash::invalid_character const& e)
    {
        std::cout << "\nRejected: " << e.what() << '\n';
    }

    return EXIT_SUCCESS;
}
