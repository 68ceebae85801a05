#ifndef INCLUDED_RANDOM_NUMBER_GENERATOR
#define INCLUDED_RANDOM_NUMBER_GENERATOR

#include "utility_concepts.hpp"
#include <cassert>
#include <concepts>
#include <random>
#include <type_traits>

namespace utility::random
{

template <utility::concepts::Arithmetic T, typename Enables = void>
class random;

template <utility::concepts::Arithmetic T>
class random<T, std::enable_if_t<std::is_integral_v<T>>>
{
public:
    using value_type = T;

    explicit random(unsigned int seed = std::random_device{}()) noexcept
    {
        seed_engine(seed);
    }

    /// @brief Generates a number in the range [min, max]
    [[nodiscard]]
    inline auto randrange(value_type min, value_type max) noexcept -> value_type
    {
        assert(min <= max);
        std::uniform_int_distribution<value_type> uniform_dist(min, max);
        return uniform_dist(random_engine_);
    }

    inline auto seed_engine(unsigned int seed) noexcept -> void
    {
        random_engine_.seed(seed);
    }

private:
    std::mt19937_64 random_engine_;
};

template <utility::concepts::Arithmetic T>
class random<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
public:
    using value_type = T;

    explicit random(unsigned int seed = std::random_device{}()) noexcept
    {
        seed_engine(seed);
    }

    /// @brief Generates a number in the range [min, max)
    [[nodiscard]]
    inline auto randrange(value_type min, value_type max) noexcept -> value_type
    {
        assert(min <= max);
        std::uniform_real_distribution<value_type> uniform_dist(min, max);
        return uniform_dist(random_engine_);
    }

    inline auto seed_engine(unsigned int seed) noexcept -> void
    {
        random_engine_.seed(seed);
    }

private:
    std::mt19937_64 random_engine_;
};

} // namespace utility::random

#endif // INCLUDED_RANDOM_NUMBER_GENERATOR
