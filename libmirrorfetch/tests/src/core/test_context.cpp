// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "mirrorfetch/core/context.hpp"

#include "mirrorfetchtests.hpp"

namespace mirrorfetch
{
    namespace
    {
        TEST_CASE("parse_context defaults", "[mirrorfetch::core]")
        {
            for (std::string_view yaml : { "", "~", "# only a comment\n" })
            {
                auto ctx = parse_context(yaml);
                REQUIRE(ctx.has_value());
                CHECK(ctx->verbosity == 0);
                CHECK(ctx->threads_params.download_threads == 5);
                CHECK(ctx->remote_fetch_params.max_retries == 3);
                CHECK(ctx->remote_fetch_params.max_attempts == 8);
                CHECK(ctx->mirror_params.health.failure_threshold == 10);
                CHECK(ctx->mirror_params.mirrors.empty());
                CHECK(ctx->mirror_params.mirrors_file.empty());
                CHECK(ctx->logging_params.logging_level == log_level::warn);
            }
        }

        TEST_CASE("parse_context full", "[mirrorfetch::core]")
        {
            constexpr std::string_view yaml = R"(
verbosity: 2
download_threads: 3
mirrors_file: /var/lib/mirrorfetch/mirrors.json
logging:
  level: debug
  pattern: "%v"
remote_fetch:
  user_agent: gutenberg-fetch/1.0
  connect_timeout_secs: 2.5
  retry_timeout: 1
  retry_backoff: 2
  max_retries: 4
  max_attempts: 12
  ssl_verify: "<false>"
  proxy_servers:
    https: http://proxy.local:3128
health:
  minor_decrement: 0.01
  failure_threshold: 4
selector:
  preferred_countries: [PT, UK]
  recency_window: 0
mirrors:
  - name: pglaf
    base_url: https://gutenberg.pglaf.org
    country: us
    priority: 5
  - name: aleph
    base_url: https://aleph.gutenberg.org/
    is_active: false
)";
            const auto parsed = parse_context(yaml);
            REQUIRE(parsed.has_value());
            const Context& ctx = parsed.value();

            CHECK(ctx.verbosity == 2);
            CHECK(ctx.threads_params.download_threads == 3);
            CHECK(ctx.mirror_params.mirrors_file == fs::path("/var/lib/mirrorfetch/mirrors.json"));
            CHECK(ctx.logging_params.logging_level == log_level::debug);
            CHECK(ctx.logging_params.log_pattern == "%v");

            const auto& remote = ctx.remote_fetch_params;
            CHECK(remote.user_agent == "gutenberg-fetch/1.0");
            CHECK(remote.connect_timeout_secs == 2.5);
            CHECK(remote.retry_timeout == 1);
            CHECK(remote.retry_backoff == 2);
            CHECK(remote.max_retries == 4);
            CHECK(remote.max_attempts == 12);
            CHECK(remote.ssl_verify == "<false>");
            CHECK(remote.proxy_servers.at("https") == "http://proxy.local:3128");

            CHECK(ctx.mirror_params.health.minor_decrement == 0.01);
            CHECK(ctx.mirror_params.health.moderate_decrement == 0.2);
            CHECK(ctx.mirror_params.health.failure_threshold == 4);
            CHECK(ctx.mirror_params.selector.preferred_countries == std::vector<std::string>{ "PT", "UK" });
            CHECK(ctx.mirror_params.selector.recency_window == 0);

            const auto& mirrors = ctx.mirror_params.mirrors;
            REQUIRE(mirrors.size() == 2);
            CHECK(mirrors[0].name == "pglaf");
            CHECK(mirrors[0].base_url == "https://gutenberg.pglaf.org/");
            CHECK(mirrors[0].country == "US");
            CHECK(mirrors[0].priority == 5);
            CHECK(mirrors[0].is_active);
            CHECK(mirrors[1].base_url == "https://aleph.gutenberg.org/");
            CHECK_FALSE(mirrors[1].is_active);

            const auto options = ctx.download_options();
            CHECK(options.max_concurrency == 3u);
            CHECK(options.persist_registry);
            CHECK(options.verbose);
        }

        TEST_CASE("parse_context top level preferred_countries", "[mirrorfetch::core]")
        {
            const auto parsed = parse_context("preferred_countries: [CA]\nunknown_key: 1\n");
            REQUIRE(parsed.has_value());
            const Context& ctx = parsed.value();
            CHECK(ctx.mirror_params.selector.preferred_countries == std::vector<std::string>{ "CA" });
        }

        TEST_CASE("parse_context errors", "[mirrorfetch::core]")
        {
            auto check_error = [](std::string_view yaml)
            {
                auto ctx = parse_context(yaml);
                REQUIRE_FALSE(ctx.has_value());
                CHECK(ctx.error().error_code() == mirrorfetch_error_code::configuration_error);
            };

            SECTION("Malformed YAML")
            {
                check_error("remote_fetch: [unclosed");
            }

            SECTION("Not a mapping")
            {
                check_error("- a\n- b\n");
                check_error("remote_fetch: 3\n");
            }

            SECTION("Bad value type")
            {
                check_error("download_threads: many\n");
                check_error("remote_fetch:\n  max_retries: often\n");
                check_error("health:\n  failure_threshold: [1]\n");
            }

            SECTION("Out of range values")
            {
                check_error("download_threads: 0\n");
                check_error("remote_fetch:\n  max_attempts: 0\n");
            }

            SECTION("Bad log level")
            {
                check_error("logging:\n  level: loud\n");
            }

            SECTION("Incomplete mirror")
            {
                check_error("mirrors:\n  - name: lonely\n");
                check_error("mirrors: pglaf\n");
            }
        }

        TEST_CASE("load_context", "[mirrorfetch::core]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto file = tmp_dir.path() / "mirrorfetch.yaml";
            mirrorfetchtests::write_file(file, "download_threads: 7\n");

            const auto loaded = load_context(file);
            REQUIRE(loaded.has_value());
            const Context& ctx = loaded.value();
            CHECK(ctx.threads_params.download_threads == 7);

            auto missing = load_context(tmp_dir.path() / "missing.yaml");
            REQUIRE_FALSE(missing.has_value());
            CHECK(missing.error().error_code() == mirrorfetch_error_code::configuration_error);
            CHECK(std::string(missing.error().what()).find("missing.yaml") != std::string::npos);
        }

        TEST_CASE("parse_log_level", "[mirrorfetch::core]")
        {
            CHECK(parse_log_level("trace") == log_level::trace);
            CHECK(parse_log_level(" Warning ") == log_level::warn);
            CHECK(parse_log_level("err") == log_level::err);
            CHECK(parse_log_level("OFF") == log_level::off);
            CHECK_FALSE(parse_log_level("verbose").has_value());
        }
    }
}
