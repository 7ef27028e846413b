#include "staging_config.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace {

std::vector<std::string> listValue(const Json::Value& value) {
    std::vector<std::string> items;
    if (value.isArray()) {
        for (const auto& item : value) {
            items.push_back(item.asString());
        }
        return items;
    }
    if (value.isNull()) {
        return items;
    }
    std::stringstream stream(value.asString());
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<long> integerValue(const Json::Value& value) {
    if (value.isIntegral()) {
        return value.asInt64();
    }
    if (value.isBool()) {
        return value.asBool() ? 1 : 0;
    }
    try {
        std::size_t used = 0;
        std::string text = value.asString();
        long parsed = std::stol(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool flagValue(const Json::Value& value) {
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isNumeric()) {
        return value.asInt() != 0;
    }
    std::string text = value.asString();
    return !(text.empty() || text == "0" || text == "false" || text == "no");
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

void appendToLog(const std::string& logFile, const std::string& entry) {
    if (logFile.empty()) {
        return;
    }
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << logFile << std::endl;
    }
}

} // namespace

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine commandLine;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            commandLine.arguments.push_back(arg);
            continue;
        }
        std::string key = arg.substr(2);
        std::optional<std::string> value;
        if (auto eq = key.find('='); eq != std::string::npos) {
            value = key.substr(eq + 1);
            key.erase(eq);
        }
        std::replace(key.begin(), key.end(), '-', '_');

        if (key == "quiet") {
            commandLine.switches["verbose"] = 0;
        } else if (value) {
            commandLine.switches[key] = *value;
        } else if (key == "verbose") {
            commandLine.switches[key] = 2;
        } else {
            commandLine.switches[key] = true;
        }
    }
    return commandLine;
}

StagingConfig::StagingConfig() : settings(Json::objectValue) {
    Json::Value defaults(Json::objectValue);
    defaults["base_dir"] = "/Lockss";
    defaults["backup"] = "./backup";
    defaults["local"] = ".";
    defaults["output"] = "text/plain";
    defaults["verbose"] = 1;
    defaults["timeout"] = 30;
    defaults["exclude"] = Json::Value(Json::arrayValue);
    defaults["exclude"].append("Thumbs.db");
    merge(defaults);
    // Defaults always resolve.
    (void)resolve();
}

StagingConfig::StagingConfig(const std::string& configFile, bool required) : StagingConfig() {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        if (required) {
            throw std::runtime_error("Failed to open config file: " + configFile);
        }
        return;
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson) || !configJson.isObject()) {
        throw std::runtime_error("Failed to parse config file: " + configFile);
    }
    merge(configJson);
    auto resolved = resolve();
    if (!resolved) {
        throw std::runtime_error("Invalid config file " + configFile + ": " + resolved.error().message);
    }
}

void StagingConfig::merge(const Json::Value& layer) {
    if (!layer.isObject()) {
        return;
    }
    for (const auto& key : layer.getMemberNames()) {
        if (key == "directory") {
            settings["subdirectory"] = layer[key];
        } else {
            settings[key] = layer[key];
        }
    }
}

Json::Value StagingConfig::pipelineLayer(const Json::Value& pipeline) {
    Json::Value layer(Json::objectValue);
    if (!pipeline.isObject()) {
        return layer;
    }
    if (pipeline.isMember("Packaged In")) {
        layer["local"] = pipeline["Packaged In"];
    }
    if (pipeline.isMember("Ingest Title")) {
        layer["au_title"] = pipeline["Ingest Title"];
    }
    if (pipeline.isMember("Plugin JAR")) {
        layer["jar"] = pipeline["Plugin JAR"];
    }
    for (const auto& pair : pipeline["parameters"]) {
        if (pair.isArray() && pair.size() == 2 && pair[0].isString()) {
            layer[pair[0].asString()] = pair[1];
        }
    }
    return layer;
}

std::expected<void, StagingError> StagingConfig::resolve() {
    local = settings.get("local", ".").asString();
    backup = settings.get("backup", "./backup").asString();
    output = settings.get("output", "text/plain").asString();
    logFile = settings.get("log_file", "").asString();

    auto verbosity = integerValue(settings.get("verbose", 1));
    if (!verbosity) {
        return std::unexpected(makeError(ErrorKind::Precondition, "Invalid verbosity: " + settings["verbose"].asString()));
    }
    verbose = static_cast<int>(*verbosity);

    auto seconds = integerValue(settings.get("timeout", 30));
    if (!seconds || *seconds <= 0) {
        return std::unexpected(makeError(ErrorKind::Precondition, "Invalid timeout: " + settings["timeout"].asString()));
    }
    timeout = *seconds;

    maxDepth.reset();
    if (settings.isMember("depth")) {
        auto depth = integerValue(settings["depth"]);
        if (!depth) {
            return std::unexpected(makeError(ErrorKind::Precondition, "Invalid depth: " + settings["depth"].asString()));
        }
        maxDepth = static_cast<int>(*depth);
    }

    exclude = listValue(settings["exclude"]);
    auto steps = listValue(settings["skip"]);
    skip = std::set<std::string>(steps.begin(), steps.end());

    dryRun = settings.isMember("dry_run") && flagValue(settings["dry_run"]);
    counts = settings.isMember("counts") && flagValue(settings["counts"]);
    skipVerification = settings.isMember("skip_verification") && flagValue(settings["skip_verification"]);
    return {};
}

std::expected<StagingEndpoint, StagingError> StagingConfig::endpoint() const {
    StagingEndpoint endpoint;
    auto applied = endpoint.overlay(settings);
    if (!applied) {
        return std::unexpected(applied.error());
    }
    return endpoint;
}

bool StagingConfig::isExcluded(const std::string& name) const {
    return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

void StagingConfig::logMessage(const std::string& message) const {
    std::string logEntry = "[" + timestamp() + "] " + message;
    std::cerr << logEntry << std::endl;
    appendToLog(logFile, logEntry);
}

void StagingConfig::logError(const std::string& message) const {
    std::string logEntry = "[" + timestamp() + "] ERROR: " + message;
    std::cerr << logEntry << std::endl;
    appendToLog(logFile, logEntry);
}
