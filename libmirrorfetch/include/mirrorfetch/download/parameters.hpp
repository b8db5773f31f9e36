// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_PARAMETERS_HPP
#define MIRRORFETCH_DOWNLOAD_PARAMETERS_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mirrorfetch::download
{
    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a directory with cert files, or a cert file.
        std::string ssl_verify = "";
        bool ssl_no_revoke = false;

        std::string user_agent = "mirrorfetch";

        // Timeouts apply to each network operation, never to a whole transfer.
        double connect_timeout_secs = 10.;
        long low_speed_limit = 30;      // bytes per second
        long low_speed_time_secs = 60;  // below low_speed_limit for that long => timeout

        int retry_timeout = 2;  // seconds
        int retry_backoff = 3;  // retry_timeout * retry_backoff
        int max_retries = 3;    // max number of retries on the same mirror
        int max_attempts = 8;   // max number of attempts for a single task

        std::map<std::string, std::string> proxy_servers;
    };

    struct HealthParams
    {
        double success_increment = 0.1;
        double minor_decrement = 0.05;
        double moderate_decrement = 0.2;
        double severe_decrement = 0.3;
        // A mirror is deactivated when its failure count goes above this value.
        std::size_t failure_threshold = 10;
    };

    struct SelectorParams
    {
        std::vector<std::string> preferred_countries = {};
        std::size_t recency_window = 3;
        double recency_penalty = 0.5;
        double country_bonus = 1.5;
    };

    struct ThreadsParams
    {
        std::size_t download_threads{ 5 };
    };

    struct Options
    {
        using termination_function = std::optional<std::function<void()>>;

        // Overrides ThreadsParams::download_threads when set.
        std::optional<std::size_t> max_concurrency = std::nullopt;
        std::stop_token stop_token = {};
        bool persist_registry = false;
        bool verbose = false;
        // SIGINT pauses the batch instead of killing the process.
        bool handle_interrupts = false;
        termination_function on_unexpected_termination = std::nullopt;
    };
}
#endif
