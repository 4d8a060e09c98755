/**
 * @file config.cpp
 */
#include "issueforest/runtime/config.hpp"
#include "issueforest/common/forest_exceptions.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace issueforest
{

namespace
{

[[noreturn]] void config_error(const std::string& message)
{
    throw ForestError(ForestErrorCode::ConfigurationError, message);
}

std::string read_string(const YAML::Node& parent, const char* key, const std::string& fallback)
{
    const YAML::Node node = parent[key];
    if (!node || node.IsNull())
    {
        return fallback;
    }
    if (!node.IsScalar())
    {
        config_error(std::string("Configuration key '") + key + "' must be a string");
    }
    return node.Scalar();
}

bool read_bool(const YAML::Node& parent, const char* key, bool fallback)
{
    const YAML::Node node = parent[key];
    if (!node || node.IsNull())
    {
        return fallback;
    }
    try
    {
        return node.as<bool>();
    }
    catch (const YAML::Exception&)
    {
        config_error(std::string("Configuration key '") + key + "' must be true or false");
    }
}

YAML::Node read_section(const YAML::Node& root, const char* key)
{
    const YAML::Node node = root[key];
    if (node && !node.IsNull() && !node.IsMap())
    {
        config_error(std::string("Configuration section '") + key + "' must be a mapping");
    }
    return node;
}

bool parse_bool_text(const std::string& raw, bool& out)
{
    if (raw == "1" || raw == "true" || raw == "yes")
    {
        out = true;
        return true;
    }
    if (raw == "0" || raw == "false" || raw == "no")
    {
        out = false;
        return true;
    }
    return false;
}

RuntimeConfig from_yaml(const YAML::Node& root)
{
    RuntimeConfig config;
    if (!root || root.IsNull())
    {
        return config;
    }
    if (!root.IsMap())
    {
        config_error("Configuration root must be a mapping");
    }

    if (const YAML::Node logging = read_section(root, "logging"); logging && logging.IsMap())
    {
        config.logging.level = read_string(logging, "level", config.logging.level);
        config.logging.pattern = read_string(logging, "pattern", config.logging.pattern);
        if (!is_valid_log_level(config.logging.level))
        {
            config_error("Unknown log level '" + config.logging.level + "'");
        }
    }

    if (const YAML::Node input = read_section(root, "input"); input && input.IsMap())
    {
        config.input.path = read_string(input, "path", config.input.path);
    }

    if (const YAML::Node output = read_section(root, "output"); output && output.IsMap())
    {
        const YAML::Node format = output["format"];
        if (format && !format.IsNull())
        {
            config.output.format = parse_output_format(read_string(output, "format", ""));
        }
        config.output.show_closed = read_bool(output, "show_closed", config.output.show_closed);
    }
    return config;
}

} // namespace

RuntimeConfig ConfigLoader::load_from_yaml(const std::string& path)
{
    YAML::Node yaml;
    try
    {
        yaml = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        config_error("Failed to load YAML config '" + path + "': " + e.what());
    }
    return from_yaml(yaml);
}

RuntimeConfig ConfigLoader::load_from_string(const std::string& yaml)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& e)
    {
        config_error(std::string("Failed to parse YAML config: ") + e.what());
    }
    return from_yaml(root);
}

void ConfigLoader::apply_environment(RuntimeConfig& config)
{
    if (const char* input = std::getenv("ISSUEFOREST_INPUT"))
    {
        config.input.path = input;
    }
    if (const char* format = std::getenv("ISSUEFOREST_OUTPUT_FORMAT"))
    {
        config.output.format = parse_output_format(format);
    }
    if (const char* show_closed = std::getenv("ISSUEFOREST_SHOW_CLOSED"))
    {
        bool value = true;
        if (!parse_bool_text(show_closed, value))
        {
            config_error(std::string("ISSUEFOREST_SHOW_CLOSED must be a boolean, got '") +
                         show_closed + "'");
        }
        config.output.show_closed = value;
    }
}

OutputFormat parse_output_format(const std::string& raw)
{
    if (raw == "summary")
    {
        return OutputFormat::Summary;
    }
    if (raw == "outline")
    {
        return OutputFormat::Outline;
    }
    config_error("Unknown output format '" + raw + "' (expected summary or outline)");
}

bool is_valid_log_level(const std::string& level)
{
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                          "error", "err", "critical", "off"};
    for (const char* name : kLevels)
    {
        if (level == name)
        {
            return true;
        }
    }
    return false;
}

} // namespace issueforest
