/**
 * @file logging.hpp
 * @brief Structured logging facade over spdlog.
 */
#pragma once
#include "issueforest/common/common.hpp"

#include <spdlog/common.h>

#include <initializer_list>
#include <string_view>

namespace issueforest
{

struct RuntimeConfig;

namespace logging
{

/**
 * @brief One `key=value` pair appended to a log line.
 */
struct LogField
{
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, int64_t value);
LogField bool_field(std::string_view key, bool value);

/**
 * @brief Install the "issueforest" logger as spdlog's default logger.
 *
 * @details
 * Level and pattern come from `config.logging`, overridden by the
 * `ISSUEFOREST_LOG_LEVEL` and `ISSUEFOREST_LOG_PATTERN` environment variables.
 * Before this is called, messages go to spdlog's stock default logger.
 *
 * @throws ForestError (ConfigurationError) if the resolved level is not a
 *         level name; the current default logger is then left in place.
 */
void initialize_logging(const RuntimeConfig& config);

void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {})
{
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {})
{
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {})
{
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {})
{
    log(spdlog::level::err, message, fields);
}

} // namespace logging
} // namespace issueforest

#define ISSUEFOREST_LOG_DEBUG(message, ...) ::issueforest::logging::log_debug((message), ##__VA_ARGS__)
#define ISSUEFOREST_LOG_INFO(message, ...) ::issueforest::logging::log_info((message), ##__VA_ARGS__)
#define ISSUEFOREST_LOG_WARN(message, ...) ::issueforest::logging::log_warn((message), ##__VA_ARGS__)
#define ISSUEFOREST_LOG_ERROR(message, ...) ::issueforest::logging::log_error((message), ##__VA_ARGS__)
