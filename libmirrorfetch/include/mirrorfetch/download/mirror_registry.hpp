// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_MIRROR_REGISTRY_HPP
#define MIRRORFETCH_DOWNLOAD_MIRROR_REGISTRY_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mirrorfetch/core/error_handling.hpp"
#include "mirrorfetch/core/util.hpp"
#include "mirrorfetch/download/mirror.hpp"
#include "mirrorfetch/download/parameters.hpp"

namespace mirrorfetch::download
{
    // What the selector needs to know about a mirror for a given identifier,
    // taken from the registry in a single consistent read.
    struct MirrorCandidate
    {
        MirrorSite site;
        Availability availability = Availability::unknown;
        bool temporarily_unavailable = false;
    };

    /**
     * The MirrorRegistry is the single shared mutable resource of a batch: every
     * in-flight task reports to it. All the read-modify-write operations on a
     * mirror are done under the registry lock.
     *
     * Mirrors are identified by their name. They are never removed, only deactivated.
     * Availability records and temporary unavailability are only kept in memory.
     */
    class MirrorRegistry
    {
    public:

        using mirror_list = std::vector<MirrorSite>;
        using clock = std::chrono::steady_clock;

        explicit MirrorRegistry(HealthParams params = {});
        MirrorRegistry(mirror_list mirrors, HealthParams params = {});

        MirrorRegistry(const MirrorRegistry&) = delete;
        MirrorRegistry& operator=(const MirrorRegistry&) = delete;
        MirrorRegistry(MirrorRegistry&&) = delete;
        MirrorRegistry& operator=(MirrorRegistry&&) = delete;

        /**
         * Adds a mirror, or updates the description of the mirror with the same
         * base URL. Health, failure count and activation state learned so far are kept.
         */
        void add_mirror(MirrorSite site);

        /// Returns false if there is no mirror with that name.
        bool deactivate(std::string_view name);

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::optional<MirrorSite> get(std::string_view name) const;

        [[nodiscard]] mirror_list list_mirrors() const;

        /**
         * Active mirrors, by decreasing priority, then decreasing health,
         * then insertion order.
         */
        [[nodiscard]] mirror_list list_active_mirrors() const;

        [[nodiscard]] std::vector<MirrorCandidate> candidates_for(std::string_view identifier) const;

        void report_success(std::string_view name);
        void report_failure(std::string_view name, FailureSeverity severity, std::string_view error = "");

        void mark_unavailable_for(std::string_view name, clock::duration duration);
        [[nodiscard]] bool is_temporarily_unavailable(std::string_view name) const;

        void mark_absent(std::string_view name, std::string_view identifier);
        void mark_present(std::string_view name, std::string_view identifier);
        [[nodiscard]] Availability
        availability(std::string_view name, std::string_view identifier) const;
        [[nodiscard]] std::vector<AvailabilityRecord>
        availability_records(std::string_view identifier) const;

        /**
         * Writes the full mirror list, health state included, as a JSON array.
         * The file is replaced atomically.
         */
        [[nodiscard]] expected_t<void> persist(const fs::path& path) const;

        /**
         * Replaces the mirror list with the one stored at ``path``.
         * On error the registry is left untouched.
         */
        [[nodiscard]] expected_t<void> load(const fs::path& path);

        [[nodiscard]] const HealthParams& params() const;

    private:

        using availability_key = std::pair<std::string, std::string>;

        MirrorSite* find_mirror(std::string_view name);
        const MirrorSite* find_mirror(std::string_view name) const;
        MirrorSite* find_mirror_by_url(std::string_view base_url);
        bool is_temporarily_unavailable_unlocked(std::string_view name, clock::time_point now) const;
        void record_availability(std::string_view name, std::string_view identifier, Availability outcome);

        HealthParams m_params;
        mirror_list m_mirrors;
        std::map<availability_key, AvailabilityRecord> m_availability;
        std::map<std::string, clock::time_point, std::less<>> m_unavailable_until;
        std::set<std::string, std::less<>> m_auto_deactivated;
        mutable std::mutex m_mutex;
    };
}
#endif
