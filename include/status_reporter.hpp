/**
 * @file status_reporter.hpp
 * @brief Renders transfer events for people and for the next pipeline stage.
 *
 * Progress notices are prefixed lines gated by verbosity. The terminal ok
 * event is rendered as JSON, as a "JSON PACKET:" line or as tab-separated
 * key/value lines, depending on the requested MIME type. For machine output
 * the notices are moved to the diagnostic stream so stdout stays parseable.
 */

#ifndef STATUS_REPORTER_HPP
#define STATUS_REPORTER_HPP

#include <ostream>
#include <string>
#include "transfer_event.hpp"

inline constexpr const char* kMimeText = "text/plain";
inline constexpr const char* kMimeJson = "application/json";
inline constexpr const char* kMimeTsv = "text/tab-separated-values";

/**
 * @brief True for the MIME types StatusReporter can render.
 */
bool isSupportedOutput(const std::string& mimeType);

class StatusReporter {
public:
    StatusReporter(std::string mimeType, int verbosity, std::ostream& out, std::ostream& err);

    void report(const TransferEvent& event);
    void operator()(const TransferEvent& event) { report(event); }

    /**
     * @brief Formats a progress event as one human-readable line, without a newline.
     */
    static std::string formatNotice(const TransferEvent& event);

    /**
     * @brief Formats the summary of an ok event for the configured MIME type.
     */
    std::string formatResult(const Json::Value& summary) const;

    const std::string& mimeType() const { return mimeType_; }
    int verbosity() const { return verbosity_; }

private:
    std::ostream& noticeStream() const;

    std::string mimeType_;
    int verbosity_;
    std::ostream& out_;
    std::ostream& err_;
};

/**
 * @brief Serializes @p value as a single line of JSON.
 */
std::string compactJson(const Json::Value& value);

#endif // STATUS_REPORTER_HPP
