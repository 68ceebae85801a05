#include "geohash/config.hpp"
#include "geohash/engine.hpp"
#include "geohash/errors.hpp"
#include "geohash/exporters/geojson.hpp"
#include "geohash/exporters/url.hpp"
#include "utility/logging.hpp"
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <span>
#include <string>
#include <string_view>

namespace
{

auto print_usage() -> void
{
    std::cerr
        << "Usage: geohash32 [-c config] <command> [args]\n"
        << "  encode <lat> <lng> [length]   encode a coordinate\n"
        << "  decode <hash>                 center, bounding box and precision\n"
        << "  precision <length>            worst case error in meters\n"
        << "  suggest <meters>              shortest length within the error\n"
        << "  url <hash> [base]             shareable url\n"
        << "  geojson <hash>                bounding box as GeoJSON\n";
}

auto print_box(geohash::bounded_hash const& d, std::string_view hash) -> void
{
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "hash:        " << hash << '\n'
              << "lat:         " << d.point.lat << '\n'
              << "lng:         " << d.point.lng << '\n'
              << "sw:          " << d.bbox.sw.lat << ", " << d.bbox.sw.lng << '\n'
              << "ne:          " << d.bbox.ne.lat << ", " << d.bbox.ne.lng << '\n'
              << std::setprecision(2) << "precision_m: " << d.precision_m << '\n';
}

auto run(std::span<char*> args, geohash::tool_config const& config) -> int
{
    LOGGING_UTILITY_SCOPED_ADD_TAG("cli");
    const geohash::engine engine{ config.engine };
    const std::string     command = args[0];
    const auto            argc    = args.size();

    if (command == "encode" && (argc == 3 || argc == 4))
    {
        const auto lat = std::stod(args[1]);
        const auto lng = std::stod(args[2]);
        std::cout << (argc == 4 ? engine.encode(lat, lng, std::stoul(args[3]))
                                : engine.encode(lat, lng))
                  << '\n';
    }
    else if (command == "decode" && argc == 2)
    {
        print_box(engine.decode_with_bounding_box(args[1]), args[1]);
    }
    else if (command == "precision" && argc == 2)
    {
        std::cout << std::fixed << std::setprecision(2)
                  << geohash::precision_meters(std::stoul(args[1])) << '\n';
    }
    else if (command == "suggest" && argc == 2)
    {
        std::cout << geohash::suggest_length_for_precision(std::stod(args[1])) << '\n';
    }
    else if (command == "url" && (argc == 2 || argc == 3))
    {
        const std::string_view base =
            argc == 3 ? std::string_view{ args[2] } : std::string_view{ config.base_url };
        std::cout << geohash::exporters::to_url(args[1], base) << '\n';
    }
    else if (command == "geojson" && argc == 2)
    {
        geohash::exporters::write_geojson(
            std::cout,
            args[1],
            { .include_center = config.include_center, .padding_m = config.padding_m }
        );
    }
    else
    {
        print_usage();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argn, char** args)
{
    if (argn < 2)
    {
        print_usage();
        return EXIT_FAILURE;
    }
    std::span<char*> arguments(args + 1, static_cast<std::size_t>(argn - 1));

    geohash::tool_config config;
    try
    {
        if (arguments.size() >= 2 && std::string_view{ arguments[0] } == "-c")
        {
            config    = geohash::tool_config::parse_config(arguments[1]);
            arguments = arguments.subspan(2);
        }
        if (arguments.empty())
        {
            print_usage();
            return EXIT_FAILURE;
        }
        return run(arguments, config);
    }
    catch (geohash::invalid_character const& e)
    {
        DEFAULT_SOURCE_LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << " (symbols are "
                  << geohash::base32::s_alphabet << ")\n";
    }
    catch (std::exception const& e)
    {
        DEFAULT_SOURCE_LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << '\n';
    }
    return EXIT_FAILURE;
}
