#include "geohash/engine.hpp"
#include "geohash/errors.hpp"
#include "utility/random.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <type_traits>

namespace
{

using namespace geohash;

// rounding of the reported center to 6 decimals
constexpr double display_tolerance = 5e-7;

TEST(Encode, KnownReferenceHashes)
{
    EXPECT_EQ(encode(57.64911, 10.40744, 11), "u4pruydqqvj");
    EXPECT_EQ(encode(40.7128, -74.0060, 5), "dr5re");
    EXPECT_EQ(encode(48.8566, 2.3522, 5), "u09tv");
    EXPECT_EQ(encode(-33.8688, 151.2093, 9), "r3gx2f77b");
    EXPECT_EQ(encode(51.5074, -0.1278, 12), "gcpvj0duq533");
}

TEST(Encode, SingaporeAtLengthSeven)
{
    const auto hash = encode(1.3521, 103.8198, 7);
    EXPECT_EQ(hash, "w21zdqp");
    EXPECT_EQ(encode(1.3521, 103.8198, 7), hash);

    const auto decoded = decode(hash);
    EXPECT_NEAR(decoded.point.lat, 1.3521, 0.01);
    EXPECT_NEAR(decoded.point.lng, 103.8198, 0.01);
}

TEST(Encode, BoundaryCoordinates)
{
    EXPECT_EQ(encode(0.0, 0.0, 5), "s0000");
    EXPECT_EQ(encode(0.0, 0.0, 1), "s");
    EXPECT_EQ(encode(90.0, 180.0, 5), "zzzzz");
    EXPECT_EQ(encode(-90.0, -180.0, 5), "00000");
    EXPECT_EQ(encode(90.0, 180.0, 12), "zzzzzzzzzzzz");
}

TEST(Encode, ClampsOutOfRangeInput)
{
    EXPECT_EQ(encode(95.0, 200.0, 5), encode(90.0, 180.0, 5));
    EXPECT_EQ(encode(-1000.0, -180.5, 6), encode(-90.0, -180.0, 6));
    EXPECT_EQ(encode(12.0, 181.0, 8), encode(12.0, 180.0, 8));
}

TEST(Encode, ExplicitLengthIsNotCapped)
{
    const auto hash = encode(57.64911, 10.40744, 14);
    EXPECT_EQ(hash, "u4pruydqqvj8pr");
    EXPECT_EQ(hash.substr(0, 11), encode(57.64911, 10.40744, 11));
    EXPECT_EQ(encode(12.0, 34.0, 30).size(), 30u);
}

TEST(Encode, ZeroLengthIsEmpty)
{
    EXPECT_EQ(encode(12.0, 34.0, 0), "");
}

TEST(Decode, KnownHash)
{
    const auto d = decode("ezs42");
    EXPECT_DOUBLE_EQ(d.point.lat, 42.60498);
    EXPECT_DOUBLE_EQ(d.point.lng, -5.603027);
    EXPECT_DOUBLE_EQ(d.bbox.sw.lat, 42.5830078125);
    EXPECT_DOUBLE_EQ(d.bbox.ne.lat, 42.626953125);
    EXPECT_DOUBLE_EQ(d.bbox.sw.lng, -5.625);
    EXPECT_DOUBLE_EQ(d.bbox.ne.lng, -5.5810546875);
}

TEST(Decode, SingleSymbolCells)
{
    const auto first = decode("0").bbox;
    EXPECT_EQ(first, (bounding_box{ { -90.0, -180.0 }, { -45.0, -135.0 } }));
    const auto last = decode("z").bbox;
    EXPECT_EQ(last, (bounding_box{ { 45.0, 135.0 }, { 90.0, 180.0 } }));
}

TEST(Decode, EmptyHashIsWholeWorld)
{
    const auto d = decode("");
    EXPECT_EQ(d.bbox, (bounding_box{ { -90.0, -180.0 }, { 90.0, 180.0 } }));
    EXPECT_EQ(d.point, (coordinate{ 0.0, 0.0 }));
}

TEST(Decode, HashesLongerThanTwelveSymbols)
{
    const auto d = decode("u4pruydqqvjxy");
    EXPECT_NEAR(d.bbox.sw.lat, 57.64911125879735, 1e-12);
    EXPECT_NEAR(d.bbox.ne.lat, 57.64911130070686, 1e-12);
    EXPECT_NEAR(d.bbox.sw.lng, 10.40743994526565, 1e-12);
    EXPECT_NEAR(d.bbox.ne.lng, 10.407439987175167, 1e-12);
    EXPECT_TRUE(decode("u4pruydqqvjx").bbox.contains(d.bbox.center()));
}

TEST(Decode, PointStaysInsideNarrowCells)
{
    utility::random::random<double> rng(948);
    for (const std::size_t length : { 11u, 12u, 13u, 15u, 20u, 24u })
    {
        for (int i = 0; i != 1000; ++i)
        {
            const auto hash =
                encode(rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0), length);
            const auto d = decode(hash);
            ASSERT_TRUE(d.bbox.contains(d.point))
                << hash << " point (" << d.point.lat << ", " << d.point.lng << ")";
            EXPECT_TRUE(decode_with_bounding_box(hash).bbox.contains(d.point)) << hash;
            if (length <= 20)
            {
                EXPECT_EQ(encode(d.point.lat, d.point.lng, length), hash);
            }
        }
    }
}

TEST(Decode, RoundsWhereTheCellAllows)
{
    // length 9 cells are wider than the 6 decimal step
    const auto d = decode("u4pruydqq");
    EXPECT_DOUBLE_EQ(d.point.lat, std::round(d.point.lat * 1e6) / 1e6);
    EXPECT_DOUBLE_EQ(d.point.lng, std::round(d.point.lng * 1e6) / 1e6);
}

TEST(Decode, RejectsInvalidCharacters)
{
    EXPECT_THROW([[maybe_unused]] auto d = decode("invalid@hash"), invalid_character);
    EXPECT_THROW([[maybe_unused]] auto d = decode("u4pa"), invalid_character);
    EXPECT_THROW(
        [[maybe_unused]] auto d = decode_with_bounding_box("u4pru!"), invalid_character
    );
}

TEST(Decode, ReportsPositionInsideLongHashes)
{
    try
    {
        [[maybe_unused]] auto d = decode("u4pruydqqvjxyzu4po");
        FAIL() << "expected invalid_character";
    }
    catch (invalid_character const& e)
    {
        EXPECT_EQ(e.character(), 'o');
        EXPECT_EQ(e.position(), 17u);
    }
}

TEST(Precision, KnownMagnitudes)
{
    EXPECT_DOUBLE_EQ(precision_meters(1), 45.0 * s_meters_per_degree);
    EXPECT_GT(precision_meters(1), 1'000'000.0);
    EXPECT_LT(precision_meters(1), 10'000'000.0);
    EXPECT_NEAR(precision_meters(5), 4891.9921875, 1e-9);
    EXPECT_LT(precision_meters(12), 0.05);
}

TEST(Precision, StrictlyDecreasingInLength)
{
    for (std::size_t length = 1; length != 20; ++length)
    {
        EXPECT_GT(precision_meters(length), precision_meters(length + 1))
            << "length " << length;
    }
}

TEST(SuggestLength, FirstLengthWithinTarget)
{
    EXPECT_EQ(suggest_length_for_precision(1e9), 1);
    EXPECT_EQ(suggest_length_for_precision(5000.0), 5);
    EXPECT_EQ(suggest_length_for_precision(4891.0), 6);
    EXPECT_EQ(suggest_length_for_precision(precision_meters(8)), 8);
    EXPECT_EQ(suggest_length_for_precision(1.0), 11);
}

TEST(SuggestLength, FallsBackToTwelve)
{
    EXPECT_EQ(suggest_length_for_precision(0.0), 12);
    EXPECT_EQ(suggest_length_for_precision(-5.0), 12);
}

TEST(BoundingBox, ShrinksWithLength)
{
    const auto coarse = decode(encode(35.6762, 139.6503, 3)).bbox;
    const auto fine   = decode(encode(35.6762, 139.6503, 7)).bbox;
    EXPECT_GT(coarse.area(), fine.area());
    EXPECT_TRUE(coarse.contains(fine.center()));
}

TEST(BoundingBox, DecodedCornersAreOrdered)
{
    const auto d = decode(encode(40.7128, -74.0060, 5));
    EXPECT_LT(d.bbox.sw.lat, d.bbox.ne.lat);
    EXPECT_LT(d.bbox.sw.lng, d.bbox.ne.lng);
    EXPECT_TRUE(d.bbox.contains(d.point));
}

TEST(Engine, DefaultLengthIsClampedWhenConfigured)
{
    EXPECT_EQ(engine_config{}.default_length(), 5u);
    EXPECT_EQ(engine_config{}.with_default_length(0).default_length(), 1u);
    EXPECT_EQ(engine_config{}.with_default_length(-3).default_length(), 1u);
    EXPECT_EQ(engine_config{}.with_default_length(20).default_length(), 12u);
    EXPECT_EQ(engine_config{}.with_default_length(9).default_length(), 9u);

    const engine e{ engine_config{}.with_default_length(20) };
    EXPECT_EQ(e.encode(51.5074, -0.1278).size(), 12u);
    EXPECT_EQ(engine{}.encode(51.5074, -0.1278).size(), 5u);
}

TEST(Engine, ExplicitLengthOverridesDefault)
{
    const engine e{ engine_config{}.with_default_length(3) };
    EXPECT_EQ(e.encode(57.64911, 10.40744, 11), "u4pruydqqvj");
    EXPECT_EQ(e.encode(57.64911, 10.40744), "u4p");
    EXPECT_EQ(e.default_length(), 3u);
}

TEST(Engine, ConfiguringReturnsNewValue)
{
    const engine_config base;
    const auto          longer = base.with_default_length(8);
    EXPECT_EQ(base.default_length(), 5u);
    EXPECT_EQ(longer.default_length(), 8u);
    EXPECT_NE(base, longer);
}

TEST(DecodeWithBoundingBox, AgreesWithBisectorCell)
{
    utility::random::random<double> rng(2024);
    for (std::size_t length = 1; length <= 12; ++length)
    {
        for (int i = 0; i != 50; ++i)
        {
            const auto hash =
                encode(rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0), length);
            const auto exact   = decode(hash);
            const auto derived = decode_with_bounding_box(hash);
            EXPECT_DOUBLE_EQ(derived.bbox.sw.lat, exact.bbox.sw.lat) << hash;
            EXPECT_DOUBLE_EQ(derived.bbox.sw.lng, exact.bbox.sw.lng) << hash;
            EXPECT_DOUBLE_EQ(derived.bbox.ne.lat, exact.bbox.ne.lat) << hash;
            EXPECT_DOUBLE_EQ(derived.bbox.ne.lng, exact.bbox.ne.lng) << hash;
            EXPECT_EQ(derived.point, exact.point);
            EXPECT_DOUBLE_EQ(derived.precision_m, precision_meters(length));
        }
    }
}

TEST(DecodeWithBoundingBox, LongHashesKeepTheCellAroundThePoint)
{
    utility::random::random<double> rng(77);
    for (const std::size_t length : { 19u, 20u, 24u, 30u })
    {
        for (int i = 0; i != 50; ++i)
        {
            const auto hash =
                encode(rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0), length);
            const auto exact   = decode(hash);
            const auto derived = decode_with_bounding_box(hash);
            EXPECT_EQ(derived.bbox, exact.bbox) << hash;
            EXPECT_GT(derived.bbox.lat_span(), 0.0) << hash;
            EXPECT_GT(derived.bbox.lng_span(), 0.0) << hash;
            EXPECT_TRUE(derived.bbox.contains(derived.point)) << hash;
        }
    }
}

TEST(DecodeWithBoundingBox, SpanMatchesPrecision)
{
    const auto d = decode_with_bounding_box("u4pru");
    EXPECT_DOUBLE_EQ(
        std::max(d.bbox.lat_span(), d.bbox.lng_span()) * s_meters_per_degree, d.precision_m
    );
}

template <std::size_t Length>
using length_t = std::integral_constant<std::size_t, Length>;

using lengths = ::testing::
    Types<length_t<1>, length_t<3>, length_t<5>, length_t<7>, length_t<9>, length_t<11>,
          length_t<12>, length_t<15>>;

template <typename T>
class GeohashPerLength : public ::testing::Test
{
protected:
    static constexpr std::size_t length = T::value;

    static constexpr std::array<coordinate, 8> fixed_points = { {
        { 40.7128, -74.0060 },  // N/W
        { 35.6762, 139.6503 },  // N/E
        { -33.8688, 151.2093 }, // S/E
        { -22.9068, -43.1729 }, // S/W
        { 0.0, 0.0 },
        { 90.0, 180.0 },
        { -90.0, -180.0 },
        { 1.3521, 103.8198 },
    } };
};

TYPED_TEST_SUITE(GeohashPerLength, lengths);

TYPED_TEST(GeohashPerLength, ProducesRequestedLengthFromAlphabet)
{
    utility::random::random<double> rng(static_cast<unsigned>(this->length));
    for (int i = 0; i != 200; ++i)
    {
        const auto hash =
            encode(rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0), this->length);
        ASSERT_EQ(hash.size(), this->length);
        EXPECT_TRUE(base32::is_valid(hash)) << hash;
    }
}

TYPED_TEST(GeohashPerLength, RoundTripStaysWithinHalfCell)
{
    const auto err = angular_error(this->length);
    utility::random::random<double> rng(static_cast<unsigned>(this->length) + 17);
    for (int i = 0; i != 200; ++i)
    {
        const coordinate c{ rng.randrange(-90.0, 90.0), rng.randrange(-180.0, 180.0) };
        const auto       d = decode(encode(c.lat, c.lng, this->length));
        EXPECT_TRUE(d.bbox.contains(c));
        EXPECT_LE(std::abs(d.point.lat - c.lat), err.lat / 2.0 + display_tolerance);
        EXPECT_LE(std::abs(d.point.lng - c.lng), err.lng / 2.0 + display_tolerance);
    }
}

TYPED_TEST(GeohashPerLength, CenterLiesInsideBox)
{
    for (auto const& c : this->fixed_points)
    {
        const auto d = decode(encode(c.lat, c.lng, this->length));
        EXPECT_TRUE(d.bbox.contains(d.bbox.center()));
        EXPECT_LE(d.bbox.sw.lat, d.bbox.ne.lat);
        EXPECT_LE(d.bbox.sw.lng, d.bbox.ne.lng);
        EXPECT_TRUE(d.bbox.contains(d.point)) << "(" << c.lat << ", " << c.lng << ")";
    }
}

TYPED_TEST(GeohashPerLength, ReencodingCenterIsIdempotent)
{
    for (auto const& c : this->fixed_points)
    {
        const auto hash   = encode(c.lat, c.lng, this->length);
        const auto center = decode(hash).bbox.center();
        EXPECT_EQ(encode(center.lat, center.lng, this->length), hash)
            << "(" << c.lat << ", " << c.lng << ")";
    }
}

TYPED_TEST(GeohashPerLength, ReencodingRoundedPointIsIdempotent)
{
    for (auto const& c : this->fixed_points)
    {
        const auto hash  = encode(c.lat, c.lng, this->length);
        const auto point = decode(hash).point;
        EXPECT_EQ(encode(point.lat, point.lng, this->length), hash)
            << "(" << c.lat << ", " << c.lng << ")";
    }
}

TYPED_TEST(GeohashPerLength, IsDeterministic)
{
    for (auto const& c : this->fixed_points)
    {
        EXPECT_EQ(encode(c.lat, c.lng, this->length), encode(c.lat, c.lng, this->length));
    }
}

} // namespace
