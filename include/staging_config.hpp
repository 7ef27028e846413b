/**
 * @file staging_config.hpp
 * @brief Configuration management for the staging tools.
 *
 * Settings are merged from layers, lowest precedence first: built-in
 * defaults, the JSON configuration file, JSON piped in from the previous
 * pipeline stage, the elements of the staging URL, and finally the command
 * line switches. Keys use the switch names with dashes folded to
 * underscores (base_dir, dry_run, skip_verification ...).
 *
 * @note The default configuration file may be absent; an explicitly named
 * one must exist and parse.
 */

#ifndef STAGING_CONFIG_HPP
#define STAGING_CONFIG_HPP

#include <expected>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <json/json.h>
#include "staging_endpoint.hpp"
#include "staging_error.hpp"

/**
 * @brief Switches and positional arguments of one invocation.
 */
struct CommandLine {
    Json::Value switches = Json::Value(Json::objectValue); ///< --key=value pairs; bare --flag is true.
    std::vector<std::string> arguments;                    ///< Positional arguments, e.g. the staging URL.

    bool has(const std::string& key) const { return switches.isMember(key); }
};

/**
 * @brief Parses "--key=value", "--flag" and positional arguments.
 *
 * "--quiet" is shorthand for "--verbose=0". Dashes inside keys become
 * underscores, so "--base-dir" and "--base_dir" are the same switch.
 */
CommandLine parseCommandLine(int argc, char* argv[]);

class StagingConfig {
public:
    static constexpr const char* kDefaultConfigFile = "stage_config.json";

    /**
     * @brief Constructs a configuration holding only the built-in defaults.
     */
    StagingConfig();

    /**
     * @brief Constructs a configuration from a JSON file layered over the defaults.
     *
     * @param configFile Path to the JSON configuration file.
     * @param required When false, a missing file leaves the defaults in place.
     * @throws std::runtime_error If the file is required but missing, or does not parse.
     */
    StagingConfig(const std::string& configFile, bool required);

    /**
     * @brief Merges one settings layer; its keys win over everything merged before.
     *
     * "directory" is folded into "subdirectory" so the later layer wins whichever alias it uses.
     */
    void merge(const Json::Value& layer);

    /**
     * @brief Maps a pipeline packet onto settings keys.
     *
     * "Packaged In" becomes local, "Ingest Title" au_title, "Plugin JAR" jar,
     * and every [key, value] pair of "parameters" its own key.
     */
    static Json::Value pipelineLayer(const Json::Value& pipeline);

    /**
     * @brief Recomputes the typed fields below from the merged settings.
     */
    std::expected<void, StagingError> resolve();

    /**
     * @brief The staging endpoint described by the merged settings.
     */
    std::expected<StagingEndpoint, StagingError> endpoint() const;

    bool skips(const std::string& step) const { return skip.contains(step); }
    bool isExcluded(const std::string& name) const;

    /**
     * @brief Logs a timestamped message to stderr and, if configured, to the log file.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a timestamped error to stderr and, if configured, to the log file.
     */
    void logError(const std::string& message) const;

    Json::Value settings;                       ///< Merged settings layers.

    std::string local = ".";                    ///< Local package directory.
    std::string backup = "./backup";            ///< Root of the timestamped download backups.
    std::string output = "text/plain";          ///< Output MIME type.
    int verbose = 1;                            ///< Progress verbosity, 0 = result only.
    std::vector<std::string> exclude;           ///< Names never transferred.
    long timeout = 30;                          ///< Connect and stall timeout in seconds.
    std::string logFile;                        ///< Optional log file.
    std::set<std::string> skip;                 ///< Steps to skip: download, backup, upload, package.
    bool dryRun = false;
    bool counts = false;                        ///< Add transfer counters to the summary.
    bool skipVerification = false;              ///< Purge downloaded files without a size check.
    std::optional<int> maxDepth;                ///< Depth limit for the remote size tally.
};

#endif // STAGING_CONFIG_HPP
