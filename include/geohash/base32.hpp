#ifndef GEOHASH_INCLUDED_BASE32
#define GEOHASH_INCLUDED_BASE32

#include "geohash/errors.hpp"
#include "geohash/types.hpp"
#include "utility/logging.hpp"
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace geohash::base32
{

using word_t = uint64_t;

// digits and lowercase letters without a, i, l, o
inline constexpr std::string_view s_alphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

inline constexpr word_t s_symbol_mask = 0b11111;

// 12 symbols = 60 bits, the most a single word carries
inline constexpr std::size_t s_max_packed_length = 12;

static_assert(s_alphabet.size() == 1u << s_bits_per_symbol);

namespace detail
{

consteval auto make_lookup() -> std::array<int8_t, 256>
{
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i != s_alphabet.size(); ++i)
    {
        table[static_cast<unsigned char>(s_alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

inline constexpr auto s_lookup = make_lookup();

} // namespace detail

[[nodiscard]]
constexpr auto symbol_of(word_t value) noexcept -> char
{
    assert(value <= s_symbol_mask && "symbol value must fit in 5 bits");
    return s_alphabet[static_cast<std::size_t>(value)];
}

[[nodiscard]]
constexpr auto value_of(char c) noexcept -> std::optional<word_t>
{
    const auto v = detail::s_lookup[static_cast<unsigned char>(c)];
    if (v < 0) return std::nullopt;
    return static_cast<word_t>(v);
}

[[nodiscard]]
constexpr auto is_valid(std::string_view hash) noexcept -> bool
{
    for (auto c : hash)
    {
        if (!value_of(c)) return false;
    }
    return true;
}

/// Renders the low length*5 bits of `bits`, most significant group first.
[[nodiscard]]
inline auto encode(word_t bits, std::size_t length) -> std::string
{
    assert(length <= s_max_packed_length && "too many symbols for one word");
    std::string out(length, '0');
    for (std::size_t i = 0; i != length; ++i)
    {
        const auto shift = (length - 1 - i) * s_bits_per_symbol;
        out[i]           = symbol_of((bits >> shift) & s_symbol_mask);
    }
    return out;
}

/// Packs the symbols of `hash` into one word, first symbol most significant.
/// `offset` is the position of hash[0] within the full hash and only feeds
/// the error report.
[[nodiscard]]
inline auto decode(std::string_view hash, std::size_t offset = 0) -> word_t
{
    assert(hash.size() <= s_max_packed_length && "too many symbols for one word");
    word_t bits = 0;
    for (std::size_t i = 0; i != hash.size(); ++i)
    {
        const auto v = value_of(hash[i]);
        if (!v)
        {
            DEFAULT_SOURCE_LOG_DEBUG(
                "base32 decode rejected symbol at position " + std::to_string(offset + i)
            );
            throw invalid_character(hash[i], offset + i);
        }
        bits = (bits << s_bits_per_symbol) | *v;
    }
    return bits;
}

} // namespace geohash::base32

#endif // GEOHASH_INCLUDED_BASE32
