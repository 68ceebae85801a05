#ifndef GEOHASH_INCLUDED_ERRORS
#define GEOHASH_INCLUDED_ERRORS

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geohash
{

/// Thrown by decode when a hash holds a symbol outside the base32 alphabet.
class invalid_character : public std::invalid_argument
{
public:
    invalid_character(char c, std::size_t position)
        : std::invalid_argument{ "Invalid base32 character '" + std::string(1, c) +
                                 "' at position " + std::to_string(position) }
        , m_character{ c }
        , m_position{ position }
    {
    }

    [[nodiscard]]
    auto character() const noexcept -> char
    {
        return m_character;
    }

    [[nodiscard]]
    auto position() const noexcept -> std::size_t
    {
        return m_position;
    }

private:
    char        m_character;
    std::size_t m_position;
};

} // namespace geohash

#endif // GEOHASH_INCLUDED_ERRORS
