// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_CORE_LOGGING_HPP
#define MIRRORFETCH_CORE_LOGGING_HPP

#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   mirrorfetch::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(mirrorfetch::log_level::trace)
#define LOG_DEBUG       LOG(mirrorfetch::log_level::debug)
#define LOG_INFO        LOG(mirrorfetch::log_level::info)
#define LOG_WARNING     LOG(mirrorfetch::log_level::warn)
#define LOG_ERROR       LOG(mirrorfetch::log_level::err)
#define LOG_CRITICAL    LOG(mirrorfetch::log_level::critical)
// clang-format on

namespace mirrorfetch
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        The values match `spdlog::level::level_enum` one to one.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    struct LoggingParams
    {
        log_level logging_level{ log_level::warn };
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
    };

    namespace logging
    {
        inline constexpr std::string_view main_logger_name = "mirrorfetch";
        inline constexpr std::string_view curl_logger_name = "libcurl";

        /** Installs the `mirrorfetch` default logger and the `libcurl` logger used for
            verbose transfer traces. Safe to call more than once; later calls only update
            the pattern and level.
         */
        void start_logging(const LoggingParams& params);

        void set_log_level(log_level level);
        log_level get_log_level();

        /// Masks `user:password@` credentials found in URLs.
        std::string hide_secrets(std::string_view str);

        class MessageLogger
        {
        public:

            explicit MessageLogger(log_level level);
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;

            static void emit(const std::string& msg, log_level level);
        };
    }
}

#endif
