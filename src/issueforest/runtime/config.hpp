/**
 * @file config.hpp
 * @brief Runtime configuration for the issueforest command line tool.
 */
#pragma once
#include "issueforest/common/common.hpp"

namespace issueforest
{

/**
 * @brief What the command line tool prints after building the forest.
 */
enum class OutputFormat
{
    Summary, ///< Status counts only.
    Outline  ///< Status counts followed by an indented outline of the forest.
};

struct LoggingConfig
{
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct InputConfig
{
    /// Issue export to read (JSON array or JSONL). Empty means "use argv".
    std::string path;
};

struct OutputConfig
{
    OutputFormat format = OutputFormat::Summary;
    bool show_closed = true;
};

/**
 * @brief Complete runtime configuration.
 *
 * @details
 * Every field has a default, so an empty YAML document is a valid
 * configuration. Precedence, lowest first: defaults, YAML file, environment
 * (`ISSUEFOREST_*`), command line.
 */
struct RuntimeConfig
{
    LoggingConfig logging;
    InputConfig input;
    OutputConfig output;
};

/**
 * @brief Loads RuntimeConfig from YAML.
 *
 * @details
 * Recognised keys:
 * @code{.yaml}
 * logging:
 *   level: info          # trace, debug, info, warn, error, critical, off
 *   pattern: "%v"        # spdlog pattern
 * input:
 *   path: issues.jsonl
 * output:
 *   format: outline      # summary or outline
 *   show_closed: false
 * @endcode
 * Unknown keys are ignored. Values of the wrong shape throw `ForestError` with
 * `ConfigurationError`.
 */
class ConfigLoader
{
public:
    static RuntimeConfig load_from_yaml(const std::string& path);

    static RuntimeConfig load_from_string(const std::string& yaml);

    /**
     * @brief Apply `ISSUEFOREST_INPUT`, `ISSUEFOREST_OUTPUT_FORMAT` and
     *        `ISSUEFOREST_SHOW_CLOSED` overrides.
     * @details Logging overrides are resolved by `logging::initialize_logging()`.
     */
    static void apply_environment(RuntimeConfig& config);
};

/**
 * @brief Parse `"summary"` or `"outline"` (case-sensitive).
 * @throw ForestError with `ConfigurationError` for any other value.
 */
OutputFormat parse_output_format(const std::string& raw);

/**
 * @brief True if `level` is a level name spdlog understands.
 */
bool is_valid_log_level(const std::string& level);

} // namespace issueforest
