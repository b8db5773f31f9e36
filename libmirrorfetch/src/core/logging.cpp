// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <memory>
#include <mutex>
#include <regex>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "mirrorfetch/core/logging.hpp"

namespace mirrorfetch::logging
{
    namespace
    {
        constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
        {
            static_assert(
                static_cast<int>(log_level::off) == static_cast<int>(spdlog::level::level_enum::off)
            );
            return static_cast<spdlog::level::level_enum>(level);
        }

        std::atomic<log_level> current_level{ log_level::warn };
        std::mutex start_mutex;

        std::shared_ptr<spdlog::logger>
        get_or_create_logger(std::string_view name, const std::string& pattern)
        {
            auto logger = spdlog::get(std::string(name));
            if (!logger)
            {
                logger = std::make_shared<spdlog::logger>(
                    std::string(name),
                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
                );
                spdlog::register_logger(logger);
            }
            logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(pattern));
            return logger;
        }

        const std::regex& http_basicauth_regex()
        {
            static const std::regex r("(://|^)([^\\s]+):([^\\s]+)@");
            return r;
        }
    }

    void start_logging(const LoggingParams& params)
    {
        const std::lock_guard<std::mutex> lock(start_mutex);

        auto main_logger = get_or_create_logger(main_logger_name, params.log_pattern);
        spdlog::set_default_logger(main_logger);
        get_or_create_logger(curl_logger_name, params.log_pattern);

        set_log_level(params.logging_level);
    }

    void set_log_level(log_level level)
    {
        current_level.store(level);
        spdlog::set_level(to_spdlog(level));
    }

    log_level get_log_level()
    {
        return current_level.load();
    }

    std::string hide_secrets(std::string_view str)
    {
        return std::regex_replace(std::string(str), http_basicauth_regex(), "$1$2:*****@");
    }

    /*****************
     * MessageLogger *
     *****************/

    MessageLogger::MessageLogger(log_level level)
        : m_level(level)
        , m_stream()
    {
    }

    MessageLogger::~MessageLogger()
    {
        if (m_level >= current_level.load() && m_level != log_level::off)
        {
            emit(m_stream.str(), m_level);
        }
    }

    void MessageLogger::emit(const std::string& msg, log_level level)
    {
        if (level == log_level::off)
        {
            return;
        }
        spdlog::default_logger_raw()->log(to_spdlog(level), hide_secrets(msg));
        if (level == log_level::critical)
        {
            spdlog::default_logger_raw()->flush();
        }
    }
}
