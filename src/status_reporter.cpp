#include "status_reporter.hpp"
#include <sstream>
#include <utility>

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool isSupportedOutput(const std::string& mimeType) {
    return mimeType == kMimeText || mimeType == kMimeJson || mimeType == kMimeTsv;
}

StatusReporter::StatusReporter(std::string mimeType, int verbosity, std::ostream& out, std::ostream& err)
    : mimeType_(std::move(mimeType)), verbosity_(verbosity), out_(out), err_(err) {}

std::ostream& StatusReporter::noticeStream() const {
    return mimeType_ == kMimeText ? out_ : err_;
}

std::string StatusReporter::formatNotice(const TransferEvent& event) {
    std::string line = event.dryRun ? "(dry-run) " : "";
    switch (event.kind) {
    case EventKind::Uploaded:
        line += ">>> " + event.payload.asString();
        break;
    case EventKind::Downloaded:
        line += "<<< " + event.payload.asString();
        break;
    case EventKind::Excluded:
        line += "--- excluded " + event.payload.asString();
        break;
    case EventKind::Chdir: {
        std::string path = event.payload.isArray() && event.payload.size() > 1
                               ? event.payload[1].asString()
                               : event.payload.asString();
        line += "... cd " + path;
        break;
    }
    case EventKind::Removed:
        line += "xxx rm " + event.payload.asString();
        break;
    case EventKind::Ok:
        line += "ok";
        break;
    }
    return line;
}

std::string StatusReporter::formatResult(const Json::Value& summary) const {
    if (mimeType_ == kMimeJson) {
        return compactJson(summary) + "\n";
    }
    if (mimeType_ == kMimeTsv) {
        std::ostringstream out;
        for (const auto& key : summary.getMemberNames()) {
            const Json::Value& value = summary[key];
            out << key << '\t' << (value.isString() ? value.asString() : compactJson(value)) << '\n';
        }
        return out.str();
    }
    return "JSON PACKET: " + compactJson(summary) + "\n";
}

void StatusReporter::report(const TransferEvent& event) {
    if (event.kind == EventKind::Ok) {
        out_ << formatResult(event.payload);
        out_.flush();
        return;
    }
    if (event.level > verbosity_) {
        return;
    }
    noticeStream() << formatNotice(event) << '\n';
}
