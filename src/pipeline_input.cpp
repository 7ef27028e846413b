#include "pipeline_input.hpp"
#include <iostream>
#include <regex>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

std::expected<Json::Value, StagingError> PipelineInput::parse(std::istream& input) {
    static const std::regex packet(R"(^(?:[A-Za-z0-9_ ]+:)?\s*(\{.*\})\s*$)");

    Json::Value merged(Json::objectValue);
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch match;
        if (!std::regex_match(line, match, packet)) {
            continue;
        }

        Json::Value object;
        Json::Reader reader;
        if (!reader.parse(match[1].str(), object) || !object.isObject()) {
            return std::unexpected(makeError(ErrorKind::Precondition,
                "Failed to parse pipeline JSON on line " + std::to_string(lineNumber) + ": " +
                reader.getFormattedErrorMessages()));
        }
        for (const auto& key : object.getMemberNames()) {
            merged[key] = object[key];
        }
    }
    return merged;
}

bool PipelineInput::stdinIsPiped() {
    if (isatty(STDIN_FILENO)) {
        return false;
    }
    struct stat info;
    if (fstat(STDIN_FILENO, &info) != 0) {
        return false;
    }
    return S_ISFIFO(info.st_mode) || S_ISREG(info.st_mode);
}

std::expected<Json::Value, StagingError> PipelineInput::readStdin() {
    if (!stdinIsPiped()) {
        return Json::Value(Json::objectValue);
    }
    return parse(std::cin);
}
