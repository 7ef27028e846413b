#include "staging_error.hpp"
#include <sstream>
#include <utility>

std::string StagingError::describe() const {
    std::ostringstream out;
    out << errorKindName(kind) << ": " << message;
    if (!url.empty()) {
        out << " (" << url << ")";
    }
    for (const auto& failure : attempts) {
        out << "\n  - " << failure.attempt << ": " << failure.cause;
    }
    if (!remedy.empty()) {
        out << "\n  " << remedy;
    }
    return out.str();
}

StagingError makeError(ErrorKind kind, std::string message) {
    StagingError error;
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

StagingError remoteNotFound(const std::string& what, const std::string& url) {
    StagingError error = makeError(ErrorKind::RemoteNotFound, "Remote location not found: " + what);
    error.url = url;
    return error;
}

StagingError interrupted() {
    return makeError(ErrorKind::Interrupted, "Interrupted by user");
}

int exitCodeFor(const StagingError& error) {
    switch (error.kind) {
    case ErrorKind::Connection:
    case ErrorKind::Authentication:
    case ErrorKind::InvalidCredential:
        return 1;
    case ErrorKind::Precondition:
        return 2;
    case ErrorKind::Interrupted:
        return 255;
    case ErrorKind::Protocol:
    case ErrorKind::RemoteNotFound:
    case ErrorKind::Filesystem:
    case ErrorKind::Unsupported:
        break;
    }
    return 3;
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Connection: return "Connection failed";
    case ErrorKind::Authentication: return "Authentication failed";
    case ErrorKind::InvalidCredential: return "Invalid credential";
    case ErrorKind::Protocol: return "Protocol error";
    case ErrorKind::Precondition: return "Precondition failed";
    case ErrorKind::RemoteNotFound: return "Not found";
    case ErrorKind::Filesystem: return "Filesystem error";
    case ErrorKind::Unsupported: return "Unsupported";
    case ErrorKind::Interrupted: return "Interrupted";
    }
    return "Error";
}
