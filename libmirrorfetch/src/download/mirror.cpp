// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cstdint>

#include "mirrorfetch/download/mirror.hpp"
#include "mirrorfetch/util/json.hpp"
#include "mirrorfetch/util/url_manip.hpp"

namespace mirrorfetch::download
{
    /**************
     * MirrorSite *
     **************/

    auto MirrorSite::build_url(std::string_view url_path) const -> std::string
    {
        return util::url_concat(base_url, url_path);
    }

    bool operator==(const MirrorSite& lhs, const MirrorSite& rhs)
    {
        return lhs.name == rhs.name && lhs.base_url == rhs.base_url && lhs.country == rhs.country
               && lhs.priority == rhs.priority && lhs.is_active == rhs.is_active
               && lhs.health_score == rhs.health_score && lhs.failure_count == rhs.failure_count
               && lhs.last_checked == rhs.last_checked && lhs.last_error == rhs.last_error;
    }

    namespace
    {
        auto to_epoch_seconds(const std::optional<time_point_t>& tp) -> std::optional<std::int64_t>
        {
            if (!tp.has_value())
            {
                return std::nullopt;
            }
            return std::chrono::duration_cast<std::chrono::seconds>(tp->time_since_epoch()).count();
        }

        auto from_epoch_seconds(const std::optional<std::int64_t>& secs) -> std::optional<time_point_t>
        {
            if (!secs.has_value())
            {
                return std::nullopt;
            }
            return time_point_t(std::chrono::seconds(secs.value()));
        }
    }

    void to_json(nlohmann::json& j, const MirrorSite& mirror)
    {
        j["name"] = mirror.name;
        j["base_url"] = mirror.base_url;
        j["country"] = mirror.country;
        j["priority"] = mirror.priority;
        j["is_active"] = mirror.is_active;
        j["health_score"] = mirror.health_score;
        j["failure_count"] = mirror.failure_count;
        j["last_checked"] = to_epoch_seconds(mirror.last_checked);
        j["last_error"] = mirror.last_error;
    }

    void from_json(const nlohmann::json& j, MirrorSite& mirror)
    {
        j.at("name").get_to(mirror.name);
        j.at("base_url").get_to(mirror.base_url);
        mirror.base_url = util::normalize_base_url(mirror.base_url);
        util::deserialize_if_present(j, "country", mirror.country);
        util::deserialize_if_present(j, "priority", mirror.priority);
        util::deserialize_if_present(j, "is_active", mirror.is_active);
        util::deserialize_if_present(j, "health_score", mirror.health_score);
        mirror.health_score = std::clamp(mirror.health_score, 0., 1.);
        util::deserialize_if_present(j, "failure_count", mirror.failure_count);
        auto last_checked = std::optional<std::int64_t>();
        util::deserialize_if_present(j, "last_checked", last_checked);
        mirror.last_checked = from_epoch_seconds(last_checked);
        util::deserialize_if_present(j, "last_error", mirror.last_error);
    }

    auto to_string(Availability availability) -> std::string_view
    {
        switch (availability)
        {
            case Availability::unknown:
                return "unknown";
            case Availability::confirmed_present:
                return "confirmed-present";
            case Availability::confirmed_absent:
                return "confirmed-absent";
        }
        return "unknown";
    }

    auto to_string(FailureSeverity severity) -> std::string_view
    {
        switch (severity)
        {
            case FailureSeverity::minor:
                return "minor";
            case FailureSeverity::moderate:
                return "moderate";
            case FailureSeverity::severe:
                return "severe";
        }
        return "unknown";
    }

    auto default_mirrors() -> std::vector<MirrorSite>
    {
        auto make = [](std::string name, std::string_view url, int priority, std::string country)
        {
            MirrorSite site;
            site.name = std::move(name);
            site.base_url = util::normalize_base_url(url);
            site.priority = priority;
            site.country = std::move(country);
            return site;
        };

        return {
            make("Project Gutenberg Main", "https://www.gutenberg.org/", 5, "US"),
            make("Project Gutenberg PGLAF", "https://gutenberg.pglaf.org/", 4, "US"),
            make("Aleph PGLAF", "https://aleph.pglaf.org/", 4, "US"),
            make("Nabasny", "https://gutenberg.nabasny.com/", 3, "US"),
            make(
                "UK Mirror Service",
                "http://www.mirrorservice.org/sites/ftp.ibiblio.org/pub/docs/books/gutenberg/",
                2,
                "UK"
            ),
            make("Xmission", "http://mirrors.xmission.com/gutenberg/", 2, "US"),
            make("University of Minho", "http://eremita.di.uminho.pt/gutenberg/", 1, "PT"),
            make("University of Waterloo", "http://mirror.csclub.uwaterloo.ca/gutenberg/", 1, "CA"),
        };
    }
}
