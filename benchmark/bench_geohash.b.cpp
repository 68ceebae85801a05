#include "geohash/engine.hpp"
#include "utility/random.hpp"
#include "utility/stopwatch.hpp"
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main()
{
    constexpr std::size_t samples = 200'000;
    constexpr unsigned    seed    = 42;

    utility::random::random<double> rng(seed);
    std::vector<geohash::coordinate> points;
    points.reserve(samples);
    for (std::size_t i = 0; i != samples; ++i)
    {
        points.push_back({ rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0) });
    }

    std::vector<std::string> hashes(samples);
    double                   checksum = 0.0;

    for (const std::size_t length : { 1u, 5u, 7u, 9u, 12u, 16u })
    {
        const std::string label = "length " + std::to_string(length);
        {
            const std::string                name = label + " encode";
            const utility::timing::stopwatch sw(name.c_str(), samples);
            for (std::size_t i = 0; i != samples; ++i)
            {
                hashes[i] = geohash::encode(points[i].lat, points[i].lng, length);
            }
        }
        {
            const std::string                name = label + " decode";
            const utility::timing::stopwatch sw(name.c_str(), samples);
            for (std::size_t i = 0; i != samples; ++i)
            {
                checksum += geohash::decode(hashes[i]).point.lat;
            }
        }
    }

    // keeps the decode loop observable
    std::cout << "checksum " << checksum << '\n';
    return EXIT_SUCCESS;
}
