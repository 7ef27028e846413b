#include "plugin_metadata.hpp"

namespace {

const char* const kDetailKeys[] = {"Plugin ID", "Plugin Name", "Plugin JAR", "Plugin Version"};

} // namespace

PipelinePluginMetadata::PipelinePluginMetadata(Json::Value pipeline) : pipeline_(std::move(pipeline)) {}

std::vector<std::pair<std::string, std::string>> PipelinePluginMetadata::getDetails() const {
    std::vector<std::pair<std::string, std::string>> details;
    if (!pipeline_.isObject()) {
        return details;
    }
    for (const char* key : kDetailKeys) {
        if (pipeline_.isMember(key) && pipeline_[key].isConvertibleTo(Json::stringValue)) {
            details.emplace_back(key, pipeline_[key].asString());
        }
    }
    return details;
}

std::vector<std::string> PipelinePluginMetadata::getParameterKeys() const {
    std::vector<std::string> keys;
    for (const auto& pair : parameters()) {
        if (pair.isArray() && pair.size() >= 1 && pair[0].isString()) {
            keys.push_back(pair[0].asString());
        }
    }
    return keys;
}

Json::Value PipelinePluginMetadata::parameters() const {
    if (pipeline_.isObject() && pipeline_["parameters"].isArray()) {
        return pipeline_["parameters"];
    }
    return Json::Value(Json::arrayValue);
}
