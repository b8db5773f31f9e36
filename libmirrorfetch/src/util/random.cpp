// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "mirrorfetch/util/random.hpp"

namespace mirrorfetch::util
{
    template auto random_generator<default_random_generator>() -> default_random_generator;

    template auto local_random_generator<default_random_generator>() -> default_random_generator&;

    auto cumulative_weights(const std::vector<double>& weights) -> std::vector<double>
    {
        auto cumulative = std::vector<double>();
        cumulative.reserve(weights.size());
        double total = 0.;
        for (const double w : weights)
        {
            total += std::max(w, 0.);
            cumulative.push_back(total);
        }
        return cumulative;
    }

    auto pick_from_cumulative(const std::vector<double>& cumulative, double unit_draw)
        -> std::optional<std::size_t>
    {
        if (cumulative.empty() || !(cumulative.back() > 0.))
        {
            return std::nullopt;
        }
        const double target = std::clamp(unit_draw, 0., 1.) * cumulative.back();
        // First slice whose upper bound is strictly above the target: zero-width slices
        // can never be hit.
        auto it = std::upper_bound(cumulative.cbegin(), cumulative.cend(), target);
        if (it == cumulative.cend())
        {
            // unit_draw == 1.0, fall back on the last non-empty slice.
            it = std::lower_bound(cumulative.cbegin(), cumulative.cend(), cumulative.back());
        }
        return static_cast<std::size_t>(std::distance(cumulative.cbegin(), it));
    }
}
