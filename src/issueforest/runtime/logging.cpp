/**
 * @file logging.cpp
 */
#include "issueforest/runtime/logging.hpp"
#include "issueforest/common/forest_exceptions.hpp"
#include "issueforest/runtime/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace issueforest
{
namespace logging
{

namespace
{

std::string resolve_level(const RuntimeConfig& config)
{
    if (const char* level = std::getenv("ISSUEFOREST_LOG_LEVEL"))
    {
        return level;
    }
    if (!config.logging.level.empty())
    {
        return config.logging.level;
    }
    return "info";
}

std::string resolve_pattern(const RuntimeConfig& config)
{
    if (const char* pattern = std::getenv("ISSUEFOREST_LOG_PATTERN"))
    {
        return pattern;
    }
    return config.logging.pattern;
}

std::string serialize_fields(std::initializer_list<LogField> fields)
{
    std::string out;
    for (const auto& field : fields)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        out += field.key;
        out += '=';
        if (field.value.find_first_of(" \t\"") != std::string::npos)
        {
            out += '"';
            for (char c : field.value)
            {
                if (c == '"' || c == '\\')
                {
                    out += '\\';
                }
                out += c;
            }
            out += '"';
        }
        else
        {
            out += field.value;
        }
    }
    return out;
}

} // namespace

LogField string_field(std::string_view key, std::string_view value)
{
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, int64_t value)
{
    return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value)
{
    return {std::string(key), value ? "true" : "false"};
}

void initialize_logging(const RuntimeConfig& config)
{
    // spdlog maps an unknown name to "off", so check before replacing anything.
    const std::string level = resolve_level(config);
    if (!is_valid_log_level(level))
    {
        throw ForestError(ForestErrorCode::ConfigurationError, "Unknown log level '" + level + "'");
    }

    // stdout carries the tool's output, so log lines go to stderr.
    spdlog::drop("issueforest");
    auto logger = spdlog::stderr_color_mt("issueforest");
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging()
{
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields)
{
    auto serialized = serialize_fields(fields);
    if (!serialized.empty())
    {
        spdlog::log(level, "{} {}", message, serialized);
        return;
    }
    spdlog::log(level, "{}", message);
}

} // namespace logging
} // namespace issueforest
