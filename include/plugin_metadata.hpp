/**
 * @file plugin_metadata.hpp
 * @brief LOCKSS plugin details carried through the staging pipeline.
 */

#ifndef PLUGIN_METADATA_HPP
#define PLUGIN_METADATA_HPP

#include <string>
#include <utility>
#include <vector>
#include <json/json.h>

class PluginMetadataProvider {
public:
    virtual ~PluginMetadataProvider() = default;

    /**
     * @brief Named plugin details, e.g. {"Plugin ID", "gov.example.Plugin"}.
     */
    virtual std::vector<std::pair<std::string, std::string>> getDetails() const = 0;

    /**
     * @brief Names of the plugin parameters that identify an Archival Unit.
     */
    virtual std::vector<std::string> getParameterKeys() const = 0;

    /**
     * @brief The parameter values as an array of [key, value] pairs.
     */
    virtual Json::Value parameters() const = 0;
};

/**
 * @brief Reads plugin details from a merged pipeline JSON object.
 *
 * Recognized keys are "Plugin ID", "Plugin Name", "Plugin JAR",
 * "Plugin Version" and "parameters", an array of [key, value] pairs.
 */
class PipelinePluginMetadata : public PluginMetadataProvider {
public:
    explicit PipelinePluginMetadata(Json::Value pipeline);

    std::vector<std::pair<std::string, std::string>> getDetails() const override;
    std::vector<std::string> getParameterKeys() const override;
    Json::Value parameters() const override;

private:
    Json::Value pipeline_;
};

#endif // PLUGIN_METADATA_HPP
