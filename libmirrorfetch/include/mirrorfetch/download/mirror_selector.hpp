// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_MIRROR_SELECTOR_HPP
#define MIRRORFETCH_DOWNLOAD_MIRROR_SELECTOR_HPP

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "mirrorfetch/download/mirror_registry.hpp"
#include "mirrorfetch/download/parameters.hpp"
#include "mirrorfetch/util/random.hpp"

namespace mirrorfetch::download
{
    /**
     * Picks one mirror per attempt with a weighted random draw.
     *
     * The weight of an eligible mirror is
     * ``health_score * max(priority, 1) * recency_penalty * country_bonus``.
     * A mirror is eligible when it is active, not confirmed absent for the
     * identifier, and not excluded by the caller. Mirrors under a temporary
     * unavailability are only picked when no other mirror is eligible.
     * When every eligible mirror has a null weight, the choice is uniform.
     */
    class MirrorSelector
    {
    public:

        using exclusion_set = std::set<std::string, std::less<>>;

        explicit MirrorSelector(
            SelectorParams params = {},
            util::default_random_generator& generator = util::local_random_generator()
        );

        MirrorSelector(const MirrorSelector&) = delete;
        MirrorSelector& operator=(const MirrorSelector&) = delete;

        [[nodiscard]] std::optional<MirrorSite> select(
            std::string_view identifier,
            const std::vector<MirrorCandidate>& candidates,
            const exclusion_set& excluded = {}
        );

        [[nodiscard]] std::optional<MirrorSite> select(
            std::string_view identifier,
            const MirrorRegistry& registry,
            const exclusion_set& excluded = {}
        );

        /**
         * Deterministic core of ``select``: ``unit_draw`` in [0, 1) replaces the
         * random draw. Does not update the recency history.
         */
        [[nodiscard]] std::optional<std::size_t> pick(
            const std::vector<MirrorCandidate>& candidates,
            const exclusion_set& excluded,
            double unit_draw
        ) const;

        /// Weight of each candidate, zero for the non eligible ones.
        [[nodiscard]] std::vector<double>
        compute_weights(const std::vector<MirrorCandidate>& candidates, const exclusion_set& excluded) const;

        [[nodiscard]] const SelectorParams& params() const;

    private:

        bool is_eligible(const MirrorCandidate& candidate, const exclusion_set& excluded) const;
        double weight(const MirrorSite& site) const;
        bool recently_used(std::string_view name) const;
        void record_use(const std::string& name);

        SelectorParams m_params;
        util::default_random_generator* p_generator;
        std::deque<std::string> m_recent;
        mutable std::mutex m_mutex;
    };
}
#endif
