// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/download/mirror_registry.hpp"
#include "mirrorfetch/util/url_manip.hpp"

namespace mirrorfetch::download
{
    namespace
    {
        double decrement_for(const HealthParams& params, FailureSeverity severity)
        {
            switch (severity)
            {
                case FailureSeverity::minor:
                    return params.minor_decrement;
                case FailureSeverity::moderate:
                    return params.moderate_decrement;
                case FailureSeverity::severe:
                    return params.severe_decrement;
            }
            return params.moderate_decrement;
        }

        void warn_unknown_mirror(std::string_view name)
        {
            LOG_WARNING << "Unknown mirror '" << name << "', ignoring report";
        }
    }

    MirrorRegistry::MirrorRegistry(HealthParams params)
        : m_params(std::move(params))
    {
    }

    MirrorRegistry::MirrorRegistry(mirror_list mirrors, HealthParams params)
        : m_params(std::move(params))
    {
        for (auto& m : mirrors)
        {
            add_mirror(std::move(m));
        }
    }

    void MirrorRegistry::add_mirror(MirrorSite site)
    {
        site.base_url = util::normalize_base_url(site.base_url);
        site.health_score = std::clamp(site.health_score, 0., 1.);

        const std::lock_guard<std::mutex> lock(m_mutex);
        if (MirrorSite* existing = find_mirror_by_url(site.base_url))
        {
            existing->name = std::move(site.name);
            existing->country = std::move(site.country);
            existing->priority = site.priority;
            LOG_DEBUG << "Updated mirror '" << existing->name << "' (" << existing->base_url << ")";
            return;
        }
        if (find_mirror(site.name) != nullptr)
        {
            LOG_WARNING << "A mirror named '" << site.name
                        << "' is already registered with another URL, ignoring " << site.base_url;
            return;
        }
        LOG_DEBUG << "Added mirror '" << site.name << "' (" << site.base_url << ")";
        m_mirrors.push_back(std::move(site));
    }

    bool MirrorRegistry::deactivate(std::string_view name)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (MirrorSite* mirror = find_mirror(name))
        {
            mirror->is_active = false;
            m_auto_deactivated.erase(mirror->name);
            LOG_INFO << "Deactivated mirror '" << name << "'";
            return true;
        }
        return false;
    }

    bool MirrorRegistry::contains(std::string_view name) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return find_mirror(name) != nullptr;
    }

    std::size_t MirrorRegistry::size() const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return m_mirrors.size();
    }

    std::optional<MirrorSite> MirrorRegistry::get(std::string_view name) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (const MirrorSite* mirror = find_mirror(name))
        {
            return *mirror;
        }
        return std::nullopt;
    }

    auto MirrorRegistry::list_mirrors() const -> mirror_list
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return m_mirrors;
    }

    auto MirrorRegistry::list_active_mirrors() const -> mirror_list
    {
        mirror_list active;
        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            std::copy_if(
                m_mirrors.cbegin(),
                m_mirrors.cend(),
                std::back_inserter(active),
                [](const MirrorSite& m) { return m.is_active; }
            );
        }
        std::stable_sort(
            active.begin(),
            active.end(),
            [](const MirrorSite& a, const MirrorSite& b)
            {
                if (a.priority != b.priority)
                {
                    return a.priority > b.priority;
                }
                return a.health_score > b.health_score;
            }
        );
        return active;
    }

    std::vector<MirrorCandidate> MirrorRegistry::candidates_for(std::string_view identifier) const
    {
        const auto now = clock::now();
        std::vector<MirrorCandidate> candidates;

        const std::lock_guard<std::mutex> lock(m_mutex);
        candidates.reserve(m_mirrors.size());
        for (const auto& mirror : m_mirrors)
        {
            auto it = m_availability.find({ mirror.name, std::string(identifier) });
            candidates.push_back({
                /* .site = */ mirror,
                /* .availability = */ it == m_availability.end() ? Availability::unknown
                                                                   : it->second.outcome,
                /* .temporarily_unavailable = */ is_temporarily_unavailable_unlocked(mirror.name, now),
            });
        }
        return candidates;
    }

    void MirrorRegistry::report_success(std::string_view name)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        MirrorSite* mirror = find_mirror(name);
        if (mirror == nullptr)
        {
            warn_unknown_mirror(name);
            return;
        }

        mirror->health_score = std::min(1., mirror->health_score + m_params.success_increment);
        mirror->failure_count /= 2;
        mirror->last_checked = std::chrono::system_clock::now();

        if (!mirror->is_active)
        {
            if (auto it = m_auto_deactivated.find(name); it != m_auto_deactivated.end())
            {
                m_auto_deactivated.erase(it);
                mirror->is_active = true;
                LOG_INFO << "Mirror '" << name << "' recovered, reactivating it";
            }
        }
        LOG_TRACE << "Mirror '" << name << "' success, health " << mirror->health_score;
    }

    void
    MirrorRegistry::report_failure(std::string_view name, FailureSeverity severity, std::string_view error)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        MirrorSite* mirror = find_mirror(name);
        if (mirror == nullptr)
        {
            warn_unknown_mirror(name);
            return;
        }

        mirror->health_score = std::max(0., mirror->health_score - decrement_for(m_params, severity));
        ++mirror->failure_count;
        mirror->last_checked = std::chrono::system_clock::now();
        if (!error.empty())
        {
            mirror->last_error = std::string(error);
        }
        LOG_DEBUG << fmt::format(
            "Mirror '{}' {} failure, health {:.2f}, failures {}",
            name,
            to_string(severity),
            mirror->health_score,
            mirror->failure_count
        );

        if (mirror->is_active && mirror->failure_count > m_params.failure_threshold)
        {
            mirror->is_active = false;
            m_auto_deactivated.insert(mirror->name);
            LOG_WARNING << "Mirror '" << name << "' failed " << mirror->failure_count
                        << " times, deactivating it";
        }
    }

    void MirrorRegistry::mark_unavailable_for(std::string_view name, clock::duration duration)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (find_mirror(name) == nullptr)
        {
            warn_unknown_mirror(name);
            return;
        }
        const auto deadline = clock::now() + duration;
        if (auto it = m_unavailable_until.find(name); it != m_unavailable_until.end())
        {
            it->second = std::max(it->second, deadline);
        }
        else
        {
            m_unavailable_until.emplace(std::string(name), deadline);
        }
    }

    bool MirrorRegistry::is_temporarily_unavailable(std::string_view name) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return is_temporarily_unavailable_unlocked(name, clock::now());
    }

    void MirrorRegistry::mark_absent(std::string_view name, std::string_view identifier)
    {
        record_availability(name, identifier, Availability::confirmed_absent);
    }

    void MirrorRegistry::mark_present(std::string_view name, std::string_view identifier)
    {
        record_availability(name, identifier, Availability::confirmed_present);
    }

    Availability MirrorRegistry::availability(std::string_view name, std::string_view identifier) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_availability.find({ std::string(name), std::string(identifier) });
        return it == m_availability.end() ? Availability::unknown : it->second.outcome;
    }

    std::vector<AvailabilityRecord>
    MirrorRegistry::availability_records(std::string_view identifier) const
    {
        std::vector<AvailabilityRecord> records;
        const std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, record] : m_availability)
        {
            if (key.second == identifier)
            {
                records.push_back(record);
            }
        }
        return records;
    }

    expected_t<void> MirrorRegistry::persist(const fs::path& path) const
    {
        nlohmann::json j = list_mirrors();

        std::error_code ec;
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                return make_unexpected(
                    fmt::format("Could not create directory for {}: {}", path.string(), ec.message()),
                    mirrorfetch_error_code::registry_io
                );
            }
        }

        fs::path tmp_path = path;
        tmp_path += ".tmp";
        {
            auto out = open_ofstream(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
            out << j.dump(4);
            out.close();
            if (!out)
            {
                return make_unexpected(
                    fmt::format("Could not write mirror list to {}", tmp_path.string()),
                    mirrorfetch_error_code::registry_io
                );
            }
        }
        fs::rename(tmp_path, path, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format("Could not replace mirror list {}: {}", path.string(), ec.message()),
                mirrorfetch_error_code::registry_io
            );
        }
        LOG_DEBUG << "Saved " << j.size() << " mirrors to " << path;
        return {};
    }

    expected_t<void> MirrorRegistry::load(const fs::path& path)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            return make_unexpected(
                fmt::format("Mirror list {} does not exist", path.string()),
                mirrorfetch_error_code::registry_io
            );
        }

        mirror_list loaded;
        try
        {
            auto in = open_ifstream(path);
            const auto j = nlohmann::json::parse(in);
            if (!j.is_array())
            {
                return make_unexpected(
                    fmt::format("Mirror list {} is not a JSON array", path.string()),
                    mirrorfetch_error_code::registry_io
                );
            }
            loaded = j.get<mirror_list>();
        }
        catch (const nlohmann::json::exception& ex)
        {
            return make_unexpected(
                fmt::format("Could not parse mirror list {}: {}", path.string(), ex.what()),
                mirrorfetch_error_code::registry_io
            );
        }

        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            m_mirrors.clear();
            m_auto_deactivated.clear();
            m_unavailable_until.clear();
        }
        for (auto& m : loaded)
        {
            add_mirror(std::move(m));
        }
        LOG_DEBUG << "Loaded " << size() << " mirrors from " << path;
        return {};
    }

    const HealthParams& MirrorRegistry::params() const
    {
        return m_params;
    }

    MirrorSite* MirrorRegistry::find_mirror(std::string_view name)
    {
        auto it = std::find_if(
            m_mirrors.begin(),
            m_mirrors.end(),
            [name](const MirrorSite& m) { return m.name == name; }
        );
        return it == m_mirrors.end() ? nullptr : &(*it);
    }

    const MirrorSite* MirrorRegistry::find_mirror(std::string_view name) const
    {
        return const_cast<MirrorRegistry*>(this)->find_mirror(name);
    }

    MirrorSite* MirrorRegistry::find_mirror_by_url(std::string_view base_url)
    {
        auto it = std::find_if(
            m_mirrors.begin(),
            m_mirrors.end(),
            [base_url](const MirrorSite& m) { return m.base_url == base_url; }
        );
        return it == m_mirrors.end() ? nullptr : &(*it);
    }

    bool
    MirrorRegistry::is_temporarily_unavailable_unlocked(std::string_view name, clock::time_point now) const
    {
        auto it = m_unavailable_until.find(name);
        return it != m_unavailable_until.end() && now < it->second;
    }

    void MirrorRegistry::record_availability(
        std::string_view name,
        std::string_view identifier,
        Availability outcome
    )
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        if (find_mirror(name) == nullptr)
        {
            warn_unknown_mirror(name);
            return;
        }
        auto key = availability_key{ std::string(name), std::string(identifier) };
        auto& record = m_availability[key];
        record.mirror = key.first;
        record.identifier = key.second;
        record.outcome = outcome;
        record.verified_at = std::chrono::system_clock::now();
        LOG_DEBUG << "Mirror '" << name << "' " << to_string(outcome) << " for '" << identifier << "'";
    }
}
