// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_CORE_CONTEXT_HPP
#define MIRRORFETCH_CORE_CONTEXT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "mirrorfetch/core/error_handling.hpp"
#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/util.hpp"
#include "mirrorfetch/download/mirror.hpp"
#include "mirrorfetch/download/parameters.hpp"

namespace mirrorfetch
{
    struct MirrorParams
    {
        // Where the registry is loaded from and persisted to, if set.
        fs::path mirrors_file = {};
        download::HealthParams health = {};
        download::SelectorParams selector = {};
        // Mirrors seeded from the configuration, on top of the persisted ones.
        std::vector<download::MirrorSite> mirrors = {};
    };

    class Context
    {
    public:

        // 2 and above turns on the libcurl traces.
        int verbosity = 0;

        LoggingParams logging_params;
        download::ThreadsParams threads_params;
        download::RemoteFetchParams remote_fetch_params;
        MirrorParams mirror_params;

        download::Options download_options() const
        {
            return {
                /* .max_concurrency = */ this->threads_params.download_threads,
                /* .stop_token = */ {},
                /* .persist_registry = */ !this->mirror_params.mirrors_file.empty(),
                /* .verbose = */ this->verbosity >= 2,
            };
        }
    };

    /**
     * Builds a Context from a YAML document.
     *
     * Missing keys keep their default value, unknown keys are reported with a
     * warning and ignored. A value of the wrong type is a configuration_error.
     */
    [[nodiscard]] expected_t<Context> parse_context(std::string_view yaml);

    [[nodiscard]] expected_t<Context> load_context(const fs::path& path);

    [[nodiscard]] expected_t<log_level> parse_log_level(std::string_view str);
}

#endif
