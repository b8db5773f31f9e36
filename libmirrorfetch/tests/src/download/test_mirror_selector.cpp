// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <map>

#include <catch2/catch_all.hpp>

#include "mirrorfetch/download/mirror_selector.hpp"

using Catch::Approx;

namespace mirrorfetch::download
{
    namespace
    {
        MirrorCandidate make_candidate(std::string name, double health = 1.0, int priority = 1)
        {
            MirrorCandidate candidate;
            candidate.site.name = std::move(name);
            candidate.site.base_url = "https://" + candidate.site.name + ".org/";
            candidate.site.health_score = health;
            candidate.site.priority = priority;
            return candidate;
        }

        SelectorParams no_recency()
        {
            SelectorParams params;
            params.recency_window = 0;
            return params;
        }

        std::map<std::string, int> count_selections(
            MirrorSelector& selector,
            const std::vector<MirrorCandidate>& candidates,
            int draws
        )
        {
            std::map<std::string, int> counts;
            for (int i = 0; i < draws; ++i)
            {
                const auto site = selector.select("12345", candidates);
                REQUIRE(site.has_value());
                ++counts[site->name];
            }
            return counts;
        }

        TEST_CASE("MirrorSelector eligibility", "[mirrorfetch::download]")
        {
            auto generator = util::default_random_generator(7);
            MirrorSelector selector(no_recency(), generator);

            auto inactive = make_candidate("inactive");
            inactive.site.is_active = false;
            auto absent = make_candidate("absent");
            absent.availability = Availability::confirmed_absent;
            auto present = make_candidate("present");
            present.availability = Availability::confirmed_present;
            const std::vector<MirrorCandidate> candidates = { inactive, absent, make_candidate("excluded"), present };

            const MirrorSelector::exclusion_set excluded = { "excluded" };
            const auto weights = selector.compute_weights(candidates, excluded);
            CHECK(weights == std::vector<double>{ 0., 0., 0., 1. });

            for (int i = 0; i < 50; ++i)
            {
                const auto site = selector.select("12345", candidates, excluded);
                REQUIRE(site.has_value());
                CHECK(site->name == "present");
            }

            CHECK_FALSE(selector.select("12345", candidates, { "excluded", "present" }).has_value());
            CHECK_FALSE(selector.select("12345", std::vector<MirrorCandidate>{}).has_value());
        }

        TEST_CASE("MirrorSelector weights", "[mirrorfetch::download]")
        {
            auto generator = util::default_random_generator(7);

            SECTION("Health times priority")
            {
                MirrorSelector selector(no_recency(), generator);
                const auto weights = selector.compute_weights(
                    { make_candidate("a", 0.5, 4), make_candidate("b", 1.0, 0), make_candidate("c", 0.0, 3) },
                    {}
                );
                REQUIRE(weights.size() == 3);
                CHECK(weights[0] == Approx(2.0));
                // Priorities below 1 count as 1.
                CHECK(weights[1] == Approx(1.0));
                CHECK(weights[2] == 0.0);
            }

            SECTION("Country bonus")
            {
                auto params = no_recency();
                params.preferred_countries = { "us" };
                MirrorSelector selector(params, generator);

                auto us = make_candidate("us");
                us.site.country = "US";
                auto uk = make_candidate("uk");
                uk.site.country = "UK";
                const auto weights = selector.compute_weights({ us, uk, make_candidate("none") }, {});
                CHECK(weights[0] == Approx(1.5));
                CHECK(weights[1] == Approx(1.0));
                CHECK(weights[2] == Approx(1.0));
            }

            SECTION("Recently used mirrors are penalized")
            {
                SelectorParams params;
                params.recency_window = 1;
                params.recency_penalty = 0.5;
                MirrorSelector selector(params, generator);

                const std::vector<MirrorCandidate> candidates = { make_candidate("a"), make_candidate("b") };
                const auto first = selector.select("12345", candidates, { "b" });
                REQUIRE(first.has_value());
                CHECK(selector.compute_weights(candidates, {}) == std::vector<double>{ 0.5, 1.0 });

                const auto second = selector.select("12345", candidates, { "a" });
                REQUIRE(second.has_value());
                // The window only remembers the last selection.
                CHECK(selector.compute_weights(candidates, {}) == std::vector<double>{ 1.0, 0.5 });
            }
        }

        TEST_CASE("MirrorSelector::pick", "[mirrorfetch::download]")
        {
            MirrorSelector selector(no_recency());

            SECTION("Weighted")
            {
                const std::vector<MirrorCandidate> candidates = {
                    make_candidate("a", 1.0, 3),
                    make_candidate("b", 1.0, 1),
                };
                CHECK(selector.pick(candidates, {}, 0.) == std::optional<std::size_t>(0));
                CHECK(selector.pick(candidates, {}, 0.74) == std::optional<std::size_t>(0));
                CHECK(selector.pick(candidates, {}, 0.76) == std::optional<std::size_t>(1));
                CHECK(selector.pick(candidates, {}, 0.999) == std::optional<std::size_t>(1));
            }

            SECTION("Excluded candidates keep their index")
            {
                const std::vector<MirrorCandidate> candidates = {
                    make_candidate("a"),
                    make_candidate("b"),
                    make_candidate("c"),
                };
                CHECK(selector.pick(candidates, { "a" }, 0.1) == std::optional<std::size_t>(1));
                CHECK(selector.pick(candidates, { "a" }, 0.9) == std::optional<std::size_t>(2));
                CHECK_FALSE(selector.pick(candidates, { "a", "b", "c" }, 0.5).has_value());
            }

            SECTION("Uniform choice when all weights are null")
            {
                const std::vector<MirrorCandidate> candidates = {
                    make_candidate("a", 0.0),
                    make_candidate("b", 0.0),
                };
                CHECK(selector.pick(candidates, {}, 0.1) == std::optional<std::size_t>(0));
                CHECK(selector.pick(candidates, {}, 0.6) == std::optional<std::size_t>(1));
            }

            SECTION("Temporarily unavailable mirrors come last")
            {
                auto limited = make_candidate("limited", 1.0, 10);
                limited.temporarily_unavailable = true;
                const std::vector<MirrorCandidate> candidates = { limited, make_candidate("slow", 0.1) };
                for (const double draw : { 0., 0.5, 0.99 })
                {
                    CHECK(selector.pick(candidates, {}, draw) == std::optional<std::size_t>(1));
                }
                // Still picked when nothing else is left.
                CHECK(selector.pick(candidates, { "slow" }, 0.5) == std::optional<std::size_t>(0));
            }
        }

        TEST_CASE("MirrorSelector distribution", "[mirrorfetch::download]")
        {
            auto generator = util::default_random_generator(42);
            MirrorSelector selector(no_recency(), generator);
            constexpr int draws = 10000;

            SECTION("Proportional to priority")
            {
                const auto counts = count_selections(
                    selector,
                    { make_candidate("a", 1.0, 2), make_candidate("b", 1.0, 1) },
                    draws
                );
                const double ratio = static_cast<double>(counts.at("a")) / draws;
                CHECK(ratio == Approx(2. / 3.).margin(0.03));
            }

            SECTION("Proportional to health")
            {
                const auto counts = count_selections(
                    selector,
                    { make_candidate("a", 1.0), make_candidate("b", 0.5), make_candidate("c", 0.0) },
                    draws
                );
                CHECK(counts.count("c") == 0);
                const double ratio = static_cast<double>(counts.at("a")) / draws;
                CHECK(ratio == Approx(2. / 3.).margin(0.03));
            }
        }

        TEST_CASE("MirrorSelector with a registry", "[mirrorfetch::download]")
        {
            MirrorSite a;
            a.name = "a";
            a.base_url = "https://a.org/";
            MirrorSite b;
            b.name = "b";
            b.base_url = "https://b.org/";
            MirrorRegistry registry({ a, b });
            registry.mark_absent("a", "12345");

            auto generator = util::default_random_generator(1);
            MirrorSelector selector(no_recency(), generator);
            for (int i = 0; i < 20; ++i)
            {
                CHECK(selector.select("12345", registry)->name == "b");
            }
            CHECK_FALSE(selector.select("12345", registry, { "b" }).has_value());
            // Absence is recorded per identifier.
            CHECK(selector.select("777", registry, { "b" })->name == "a");
        }
    }
}
