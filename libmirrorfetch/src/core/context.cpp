// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <array>
#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "mirrorfetch/core/context.hpp"
#include "mirrorfetch/util/string.hpp"
#include "mirrorfetch/util/url_manip.hpp"

namespace mirrorfetch
{
    namespace
    {
        template <std::size_t N>
        void warn_unknown_keys(
            const YAML::Node& node,
            std::string_view section,
            const std::array<std::string_view, N>& known
        )
        {
            for (const auto& item : node)
            {
                const auto key = item.first.as<std::string>();
                if (std::find(known.cbegin(), known.cend(), key) == known.cend())
                {
                    LOG_WARNING << fmt::format("Unknown configuration key '{}{}', ignoring it", section, key);
                }
            }
        }

        // Reads node[key] into out if present.
        template <class T>
        expected_t<void>
        read_value(const YAML::Node& node, std::string_view section, const char* key, T& out)
        {
            const YAML::Node value = node[key];
            if (!value || value.IsNull())
            {
                return {};
            }
            try
            {
                out = value.as<T>();
            }
            catch (const YAML::Exception& e)
            {
                return make_unexpected(
                    fmt::format("Invalid value for '{}{}': {}", section, key, e.msg),
                    mirrorfetch_error_code::configuration_error
                );
            }
            return {};
        }

        expected_t<void> require_map(const YAML::Node& node, std::string_view name)
        {
            if (node && !node.IsNull() && !node.IsMap())
            {
                return make_unexpected(
                    fmt::format("Configuration section '{}' must be a mapping", name),
                    mirrorfetch_error_code::configuration_error
                );
            }
            return {};
        }

        expected_t<void> parse_logging(const YAML::Node& node, LoggingParams& params)
        {
            static constexpr std::array<std::string_view, 2> known = { "level", "pattern" };
            warn_unknown_keys(node, "logging.", known);

            std::string level;
            if (auto res = read_value(node, "logging.", "level", level); !res)
            {
                return res;
            }
            if (!level.empty())
            {
                auto parsed = parse_log_level(level);
                if (!parsed)
                {
                    return forward_error(parsed);
                }
                params.logging_level = parsed.value();
            }
            return read_value(node, "logging.", "pattern", params.log_pattern);
        }

        expected_t<void> parse_remote_fetch(const YAML::Node& node, download::RemoteFetchParams& params)
        {
            static constexpr std::array<std::string_view, 11> known = {
                "user_agent",  "connect_timeout_secs", "low_speed_limit", "low_speed_time_secs",
                "retry_timeout", "retry_backoff",      "max_retries",     "max_attempts",
                "ssl_verify",  "ssl_no_revoke",        "proxy_servers",
            };
            constexpr std::string_view s = "remote_fetch.";
            warn_unknown_keys(node, s, known);

            for (auto res : {
                     read_value(node, s, "user_agent", params.user_agent),
                     read_value(node, s, "connect_timeout_secs", params.connect_timeout_secs),
                     read_value(node, s, "low_speed_limit", params.low_speed_limit),
                     read_value(node, s, "low_speed_time_secs", params.low_speed_time_secs),
                     read_value(node, s, "retry_timeout", params.retry_timeout),
                     read_value(node, s, "retry_backoff", params.retry_backoff),
                     read_value(node, s, "max_retries", params.max_retries),
                     read_value(node, s, "max_attempts", params.max_attempts),
                     read_value(node, s, "ssl_verify", params.ssl_verify),
                     read_value(node, s, "ssl_no_revoke", params.ssl_no_revoke),
                     read_value(node, s, "proxy_servers", params.proxy_servers),
                 })
            {
                if (!res)
                {
                    return res;
                }
            }
            if (params.max_attempts < 1)
            {
                return make_unexpected(
                    "'remote_fetch.max_attempts' must be at least 1",
                    mirrorfetch_error_code::configuration_error
                );
            }
            return {};
        }

        expected_t<void> parse_health(const YAML::Node& node, download::HealthParams& params)
        {
            static constexpr std::array<std::string_view, 5> known = {
                "success_increment", "minor_decrement",   "moderate_decrement",
                "severe_decrement",  "failure_threshold",
            };
            constexpr std::string_view s = "health.";
            warn_unknown_keys(node, s, known);

            for (auto res : {
                     read_value(node, s, "success_increment", params.success_increment),
                     read_value(node, s, "minor_decrement", params.minor_decrement),
                     read_value(node, s, "moderate_decrement", params.moderate_decrement),
                     read_value(node, s, "severe_decrement", params.severe_decrement),
                     read_value(node, s, "failure_threshold", params.failure_threshold),
                 })
            {
                if (!res)
                {
                    return res;
                }
            }
            return {};
        }

        expected_t<void> parse_selector(const YAML::Node& node, download::SelectorParams& params)
        {
            static constexpr std::array<std::string_view, 4> known = {
                "preferred_countries",
                "recency_window",
                "recency_penalty",
                "country_bonus",
            };
            constexpr std::string_view s = "selector.";
            warn_unknown_keys(node, s, known);

            for (auto res : {
                     read_value(node, s, "preferred_countries", params.preferred_countries),
                     read_value(node, s, "recency_window", params.recency_window),
                     read_value(node, s, "recency_penalty", params.recency_penalty),
                     read_value(node, s, "country_bonus", params.country_bonus),
                 })
            {
                if (!res)
                {
                    return res;
                }
            }
            return {};
        }

        expected_t<void> parse_mirrors(const YAML::Node& node, std::vector<download::MirrorSite>& mirrors)
        {
            if (!node.IsSequence())
            {
                return make_unexpected(
                    "Configuration key 'mirrors' must be a list",
                    mirrorfetch_error_code::configuration_error
                );
            }

            static constexpr std::array<std::string_view, 5> known = {
                "name", "base_url", "country", "priority", "is_active",
            };
            for (const auto& item : node)
            {
                if (!item.IsMap() || !item["name"] || !item["base_url"])
                {
                    return make_unexpected(
                        "Each mirror needs at least a 'name' and a 'base_url'",
                        mirrorfetch_error_code::configuration_error
                    );
                }
                warn_unknown_keys(item, "mirrors[].", known);

                download::MirrorSite site;
                constexpr std::string_view s = "mirrors[].";
                for (auto res : {
                         read_value(item, s, "name", site.name),
                         read_value(item, s, "base_url", site.base_url),
                         read_value(item, s, "country", site.country),
                         read_value(item, s, "priority", site.priority),
                         read_value(item, s, "is_active", site.is_active),
                     })
                {
                    if (!res)
                    {
                        return res;
                    }
                }
                site.base_url = util::normalize_base_url(site.base_url);
                site.country = util::to_upper(site.country);
                mirrors.push_back(std::move(site));
            }
            return {};
        }
    }

    expected_t<log_level> parse_log_level(std::string_view str)
    {
        const auto lower = util::to_lower(util::strip(str));
        if (lower == "trace")
        {
            return log_level::trace;
        }
        if (lower == "debug")
        {
            return log_level::debug;
        }
        if (lower == "info")
        {
            return log_level::info;
        }
        if (lower == "warn" || lower == "warning")
        {
            return log_level::warn;
        }
        if (lower == "err" || lower == "error")
        {
            return log_level::err;
        }
        if (lower == "critical")
        {
            return log_level::critical;
        }
        if (lower == "off")
        {
            return log_level::off;
        }
        return make_unexpected(
            fmt::format("Invalid log level '{}'", str),
            mirrorfetch_error_code::configuration_error
        );
    }

    expected_t<Context> parse_context(std::string_view yaml)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(std::string(yaml));
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Malformed configuration: {}", e.what()),
                mirrorfetch_error_code::configuration_error
            );
        }

        Context ctx;
        if (!root || root.IsNull())
        {
            return ctx;
        }
        if (!root.IsMap())
        {
            return make_unexpected(
                "The configuration must be a YAML mapping",
                mirrorfetch_error_code::configuration_error
            );
        }

        static constexpr std::array<std::string_view, 9> known = {
            "verbosity", "download_threads", "logging",  "remote_fetch", "mirrors_file",
            "health",    "selector",         "mirrors",  "preferred_countries",
        };
        warn_unknown_keys(root, "", known);

        for (const char* section : { "logging", "remote_fetch", "health", "selector" })
        {
            if (auto res = require_map(root[section], section); !res)
            {
                return forward_error(res);
            }
        }

        std::string mirrors_file;
        std::size_t download_threads = ctx.threads_params.download_threads;
        for (auto res : {
                 read_value(root, "", "verbosity", ctx.verbosity),
                 read_value(root, "", "download_threads", download_threads),
                 read_value(root, "", "mirrors_file", mirrors_file),
                 // Shortcut for selector.preferred_countries
                 read_value(root, "", "preferred_countries", ctx.mirror_params.selector.preferred_countries),
             })
        {
            if (!res)
            {
                return forward_error(res);
            }
        }
        if (download_threads == 0)
        {
            return make_unexpected(
                "'download_threads' must be at least 1",
                mirrorfetch_error_code::configuration_error
            );
        }
        ctx.threads_params.download_threads = download_threads;
        ctx.mirror_params.mirrors_file = mirrors_file;

        if (root["logging"])
        {
            if (auto res = parse_logging(root["logging"], ctx.logging_params); !res)
            {
                return forward_error(res);
            }
        }
        if (root["remote_fetch"])
        {
            if (auto res = parse_remote_fetch(root["remote_fetch"], ctx.remote_fetch_params); !res)
            {
                return forward_error(res);
            }
        }
        if (root["health"])
        {
            if (auto res = parse_health(root["health"], ctx.mirror_params.health); !res)
            {
                return forward_error(res);
            }
        }
        if (root["selector"])
        {
            if (auto res = parse_selector(root["selector"], ctx.mirror_params.selector); !res)
            {
                return forward_error(res);
            }
        }
        if (root["mirrors"])
        {
            if (auto res = parse_mirrors(root["mirrors"], ctx.mirror_params.mirrors); !res)
            {
                return forward_error(res);
            }
        }
        return ctx;
    }

    expected_t<Context> load_context(const fs::path& path)
    {
        auto in = open_ifstream(path, std::ios::in);
        if (!in)
        {
            return make_unexpected(
                fmt::format("Could not read configuration file {}", path.string()),
                mirrorfetch_error_code::configuration_error
            );
        }
        std::stringstream content;
        content << in.rdbuf();
        LOG_DEBUG << "Loading configuration from " << path;
        return parse_context(content.str());
    }
}
