/**
 * @file pipeline_input.hpp
 * @brief JSON handed over on stdin by the previous pipeline stage.
 *
 * Each stage prints its result as a JSON object line, optionally labelled
 * ("JSON PACKET: {...}"). Lines that are not JSON objects are ignored, so
 * human-readable progress may be piped along with the packets.
 */

#ifndef PIPELINE_INPUT_HPP
#define PIPELINE_INPUT_HPP

#include <expected>
#include <istream>
#include <string>
#include <json/json.h>
#include "staging_error.hpp"

class PipelineInput {
public:
    /**
     * @brief Merges every JSON object line of @p input, later keys winning.
     *
     * @return The merged object, empty when no line matched.
     * A line that looks like a packet but does not parse is a Precondition error.
     */
    static std::expected<Json::Value, StagingError> parse(std::istream& input);

    /**
     * @brief True when stdin is a pipe or a redirected regular file, not a terminal.
     */
    static bool stdinIsPiped();

    /**
     * @brief Parses stdin when it is piped, otherwise returns an empty object.
     */
    static std::expected<Json::Value, StagingError> readStdin();
};

#endif // PIPELINE_INPUT_HPP
