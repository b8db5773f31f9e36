// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cmath>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/download/mirror_selector.hpp"
#include "mirrorfetch/util/string.hpp"

namespace mirrorfetch::download
{
    MirrorSelector::MirrorSelector(SelectorParams params, util::default_random_generator& generator)
        : m_params(std::move(params))
        , p_generator(&generator)
    {
        for (auto& country : m_params.preferred_countries)
        {
            country = util::to_upper(country);
        }
    }

    auto MirrorSelector::select(
        std::string_view identifier,
        const std::vector<MirrorCandidate>& candidates,
        const exclusion_set& excluded
    ) -> std::optional<MirrorSite>
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        const auto index = pick(candidates, excluded, util::random_unit(*p_generator));
        if (!index.has_value())
        {
            LOG_DEBUG << "No eligible mirror left for '" << identifier << "'";
            return std::nullopt;
        }

        const MirrorSite& site = candidates[index.value()].site;
        record_use(site.name);
        LOG_TRACE << "Selected mirror '" << site.name << "' for '" << identifier << "'";
        return site;
    }

    auto MirrorSelector::select(
        std::string_view identifier,
        const MirrorRegistry& registry,
        const exclusion_set& excluded
    ) -> std::optional<MirrorSite>
    {
        return select(identifier, registry.candidates_for(identifier), excluded);
    }

    auto MirrorSelector::pick(
        const std::vector<MirrorCandidate>& candidates,
        const exclusion_set& excluded,
        double unit_draw
    ) const -> std::optional<std::size_t>
    {
        std::vector<std::size_t> pool;
        std::vector<std::size_t> unavailable;
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            if (is_eligible(candidates[i], excluded))
            {
                (candidates[i].temporarily_unavailable ? unavailable : pool).push_back(i);
            }
        }
        if (pool.empty())
        {
            pool = std::move(unavailable);
        }
        if (pool.empty())
        {
            return std::nullopt;
        }

        std::vector<double> weights;
        weights.reserve(pool.size());
        for (const std::size_t i : pool)
        {
            weights.push_back(weight(candidates[i].site));
        }

        if (auto picked = util::pick_from_cumulative(util::cumulative_weights(weights), unit_draw))
        {
            return pool[picked.value()];
        }

        // All the weights are null, uniform choice.
        const double scaled = std::floor(std::clamp(unit_draw, 0., 1.) * static_cast<double>(pool.size()));
        const auto slot = std::min(static_cast<std::size_t>(scaled), pool.size() - 1);
        return pool[slot];
    }

    std::vector<double> MirrorSelector::compute_weights(
        const std::vector<MirrorCandidate>& candidates,
        const exclusion_set& excluded
    ) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<double> weights;
        weights.reserve(candidates.size());
        for (const auto& candidate : candidates)
        {
            weights.push_back(is_eligible(candidate, excluded) ? weight(candidate.site) : 0.);
        }
        return weights;
    }

    const SelectorParams& MirrorSelector::params() const
    {
        return m_params;
    }

    bool MirrorSelector::is_eligible(const MirrorCandidate& candidate, const exclusion_set& excluded) const
    {
        return candidate.site.is_active && candidate.availability != Availability::confirmed_absent
               && !excluded.contains(candidate.site.name);
    }

    double MirrorSelector::weight(const MirrorSite& site) const
    {
        const double priority_factor = static_cast<double>(std::max(site.priority, 1));
        const double recency = recently_used(site.name) ? m_params.recency_penalty : 1.;
        const auto& preferred = m_params.preferred_countries;
        const bool is_preferred = !site.country.empty()
                                  && std::find(preferred.cbegin(), preferred.cend(), util::to_upper(site.country))
                                         != preferred.cend();
        const double country = is_preferred ? m_params.country_bonus : 1.;
        return std::clamp(site.health_score, 0., 1.) * priority_factor * recency * country;
    }

    bool MirrorSelector::recently_used(std::string_view name) const
    {
        return std::find(m_recent.cbegin(), m_recent.cend(), name) != m_recent.cend();
    }

    void MirrorSelector::record_use(const std::string& name)
    {
        if (m_params.recency_window == 0)
        {
            return;
        }
        m_recent.push_back(name);
        while (m_recent.size() > m_params.recency_window)
        {
            m_recent.pop_front();
        }
    }
}
