// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_MIRROR_HPP
#define MIRRORFETCH_DOWNLOAD_MIRROR_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace mirrorfetch::download
{
    using time_point_t = std::chrono::system_clock::time_point;

    // A MirrorSite is an origin server hosting a copy of the resource set.
    // Its health is learned from the outcome of the transfers issued against it
    // and is only updated through the MirrorRegistry.
    struct MirrorSite
    {
        std::string name;
        std::string base_url;
        std::string country = "";
        int priority = 1;
        bool is_active = true;
        double health_score = 1.0;
        std::size_t failure_count = 0;
        std::optional<time_point_t> last_checked = std::nullopt;
        std::optional<std::string> last_error = std::nullopt;

        // {base_url}/{url_path}
        [[nodiscard]] auto build_url(std::string_view url_path) const -> std::string;
    };

    bool operator==(const MirrorSite& lhs, const MirrorSite& rhs);

    void to_json(nlohmann::json& j, const MirrorSite& mirror);
    void from_json(const nlohmann::json& j, MirrorSite& mirror);

    enum class Availability
    {
        unknown,
        confirmed_present,
        confirmed_absent,
    };

    [[nodiscard]] auto to_string(Availability availability) -> std::string_view;

    struct AvailabilityRecord
    {
        std::string mirror;
        std::string identifier;
        Availability outcome = Availability::unknown;
        time_point_t verified_at = {};
    };

    enum class FailureSeverity
    {
        minor,
        moderate,
        severe,
    };

    [[nodiscard]] auto to_string(FailureSeverity severity) -> std::string_view;

    /**
     * Built-in list of mirrors, used when no mirror list has been persisted
     * or configured yet.
     */
    [[nodiscard]] auto default_mirrors() -> std::vector<MirrorSite>;
}
#endif
