#ifndef GEOHASH_INCLUDED_CONFIG
#define GEOHASH_INCLUDED_CONFIG

#include <algorithm>
#include <cstddef>
#include <string>

namespace geohash
{

/// Default hash length used when a caller does not pass one. Immutable once
/// built; with_default_length hands out a clamped copy.
class engine_config
{
public:
    static constexpr int s_min_default_length = 1;
    static constexpr int s_max_default_length = 12;
    static constexpr int s_initial_length     = 5;

    constexpr engine_config() noexcept = default;

    [[nodiscard]]
    constexpr auto with_default_length(int length) const noexcept -> engine_config
    {
        engine_config c{ *this };
        c.m_default_length = static_cast<std::size_t>(
            std::clamp(length, s_min_default_length, s_max_default_length)
        );
        return c;
    }

    [[nodiscard]]
    constexpr auto default_length() const noexcept -> std::size_t
    {
        return m_default_length;
    }

    auto operator==(engine_config const&) const noexcept -> bool = default;

private:
    std::size_t m_default_length = s_initial_length;
};

/// Settings of the command line tool, read from a `key value` file.
struct tool_config
{
    static auto parse_config(std::string const& file_name) -> tool_config;

    engine_config engine{};
    std::string   base_url = "https://geo.local"; /* prefix for url output */
    double        padding_m{};                    /* geojson bbox margin in meters */
    bool          include_center = true;          /* geojson center point on/off */
};

} // namespace geohash

#endif // GEOHASH_INCLUDED_CONFIG
