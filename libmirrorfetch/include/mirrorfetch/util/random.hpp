// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_UTIL_RANDOM_HPP
#define MIRRORFETCH_UTIL_RANDOM_HPP

#include <algorithm>
#include <array>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace mirrorfetch::util
{
    using default_random_generator = std::mt19937;

    template <typename Generator = default_random_generator>
    [[nodiscard]] auto random_generator() -> Generator;

    template <typename Generator = default_random_generator>
    auto local_random_generator() -> Generator&;

    /** Uniform draw in [0, 1). */
    template <typename Generator = default_random_generator>
    auto random_unit(Generator& generator = local_random_generator()) -> double;

    /** Running sum of the weights. Negative weights are treated as zero. */
    [[nodiscard]] auto cumulative_weights(const std::vector<double>& weights)
        -> std::vector<double>;

    /** Maps a uniform draw in [0, 1) onto the index whose cumulative slice contains it.
        Returns nothing when the total weight is zero.
        This is deterministic for a given draw, so that tests can pin the outcome.
    */
    [[nodiscard]] auto pick_from_cumulative(const std::vector<double>& cumulative, double unit_draw)
        -> std::optional<std::size_t>;

    /********************
     *  Implementation  *
     ********************/

    template <typename Generator>
    auto random_generator() -> Generator
    {
        using std::begin;
        using std::end;
        constexpr auto seed_bits = sizeof(typename Generator::result_type) * Generator::state_size;
        constexpr auto seed_len = seed_bits / std::numeric_limits<std::seed_seq::result_type>::digits;
        auto seed = std::array<std::seed_seq::result_type, seed_len>{};
        auto dev = std::random_device{};
        std::generate_n(begin(seed), seed_len, std::ref(dev));
        auto seed_seq = std::seed_seq(begin(seed), end(seed));
        return Generator{ seed_seq };
    }

    extern template auto random_generator<default_random_generator>() -> default_random_generator;

    template <typename Generator>
    auto local_random_generator() -> Generator&
    {
        thread_local auto rng = random_generator<Generator>();
        return rng;
    }

    extern template auto local_random_generator<default_random_generator>()
        -> default_random_generator&;

    template <typename Generator>
    auto random_unit(Generator& generator) -> double
    {
        return std::uniform_real_distribution<double>{ 0.0, 1.0 }(generator);
    }
}
#endif
