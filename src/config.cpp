#include "geohash/config.hpp"
#include "utility/logging.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

namespace geohash
{

auto tool_config::parse_config(std::string const& file_name) -> tool_config
{
    tool_config   c;
    std::ifstream file(file_name);
    if (!file.is_open())
    {
        DEFAULT_SOURCE_LOG_ERROR("Could not open config file " + file_name);
        throw std::runtime_error("Cannot open config file: " + file_name);
    }

    std::string var;
    while (file >> var)
    {
        if (var[0] == '#')
        { /* ignore comment line*/
            file.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            continue;
        }

        if (var == "default_length")
        {
            int length{};
            file >> length;
            c.engine = c.engine.with_default_length(length);
            if (file && c.engine.default_length() != static_cast<std::size_t>(length))
            {
                DEFAULT_SOURCE_LOG_WARNING(
                    "default_length " + std::to_string(length) + " clamped to " +
                    std::to_string(c.engine.default_length())
                );
            }
        }
        else if (var == "base_url")
        {
            file >> c.base_url;
        }
        else if (var == "padding_m")
        {
            file >> c.padding_m;
        }
        else if (var == "include_center")
        {
            std::string str;
            file >> str;
            if (str == "on" || str == "off")
            {
                c.include_center = str == "on";
            }
            else
            {
                file.setstate(std::ios::failbit);
            }
        }
        else
        {
            DEFAULT_SOURCE_LOG_ERROR("Unknown config key " + var);
            throw std::runtime_error("Unknown config key '" + var + "' in " + file_name);
        }

        if (file.fail())
        {
            DEFAULT_SOURCE_LOG_ERROR("Malformed value for config key " + var);
            throw std::runtime_error("Malformed value for '" + var + "' in " + file_name);
        }
    }

    DEFAULT_SOURCE_LOG_DEBUG("Loaded config " + file_name);
    return c;
}

} // namespace geohash
