#include "staging_endpoint.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct UrlHandleDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

std::optional<std::string> urlPart(CURLU* handle, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, CURLU_URLDECODE) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string lowercase(std::string text) {
    std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::optional<std::string> switchValue(const Json::Value& switches, const char* key) {
    if (!switches.isMember(key) || switches[key].isNull()) {
        return std::nullopt;
    }
    return switches[key].asString();
}

} // namespace

const char* protocolName(Protocol protocol) {
    return protocol == Protocol::Sftp ? "sftp" : "ftp";
}

std::optional<Protocol> parseProtocol(const std::string& scheme) {
    auto name = lowercase(scheme);
    if (name == "ftp") {
        return Protocol::Ftp;
    }
    if (name == "sftp" || name == "scp") {
        return Protocol::Sftp;
    }
    return std::nullopt;
}

std::optional<AuthMode> parseAuthMode(const std::string& name) {
    auto mode = lowercase(name);
    if (mode.empty()) {
        return AuthMode::Unspecified;
    }
    if (mode == "agent") {
        return AuthMode::Agent;
    }
    if (mode == "keyfile" || mode == "key") {
        return AuthMode::KeyFile;
    }
    if (mode == "password") {
        return AuthMode::Password;
    }
    return std::nullopt;
}

bool supportsKeyAuthentication(Protocol protocol) {
    return protocol == Protocol::Sftp;
}

std::expected<Json::Value, StagingError> StagingEndpoint::urlElements(const std::string& url) {
    std::unique_ptr<CURLU, UrlHandleDeleter> handle(curl_url());
    if (!handle) {
        return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to allocate URL parser"));
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::unexpected(makeError(ErrorKind::Precondition, "Malformed staging URL: " + url));
    }

    Json::Value elements(Json::objectValue);
    auto scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    if (!parseProtocol(scheme.value_or(""))) {
        return std::unexpected(makeError(ErrorKind::Precondition, "Unsupported staging protocol: " + scheme.value_or("")));
    }
    elements["protocol"] = lowercase(*scheme);

    if (auto host = urlPart(handle.get(), CURLUPART_HOST); host && !host->empty()) {
        elements["host"] = *host;
    }
    if (auto port = urlPart(handle.get(), CURLUPART_PORT)) {
        elements["port"] = *port;
    }
    if (auto user = urlPart(handle.get(), CURLUPART_USER)) {
        elements["user"] = *user;
    }
    if (auto password = urlPart(handle.get(), CURLUPART_PASSWORD)) {
        elements["password"] = *password;
    }
    if (auto path = urlPart(handle.get(), CURLUPART_PATH); path && path->size() > 1) {
        elements["base_dir"] = trimTrailingSlash(*path);
    }
    return elements;
}

std::expected<StagingEndpoint, StagingError> StagingEndpoint::fromUrl(const std::string& url) {
    auto elements = urlElements(url);
    if (!elements) {
        return std::unexpected(elements.error());
    }
    StagingEndpoint endpoint;
    auto applied = endpoint.overlay(*elements);
    if (!applied) {
        return std::unexpected(applied.error());
    }
    return endpoint;
}

std::expected<void, StagingError> StagingEndpoint::overlay(const Json::Value& switches) {
    if (auto value = switchValue(switches, "protocol")) {
        auto parsed = parseProtocol(*value);
        if (!parsed) {
            return std::unexpected(makeError(ErrorKind::Precondition, "Unsupported staging protocol: " + *value));
        }
        protocol = *parsed;
    }
    if (auto value = switchValue(switches, "host")) {
        host = *value;
    }
    if (auto value = switchValue(switches, "port")) {
        try {
            port = std::stoi(*value);
        } catch (const std::exception&) {
            return std::unexpected(makeError(ErrorKind::Precondition, "Invalid port: " + *value));
        }
    }
    if (auto value = switchValue(switches, "user")) {
        user = *value;
    }
    if (auto value = switchValue(switches, "pass")) {
        password = *value;
    }
    if (auto value = switchValue(switches, "password")) {
        password = *value;
    }
    if (auto value = switchValue(switches, "base_dir")) {
        baseDir = trimTrailingSlash(*value);
    }
    if (auto value = switchValue(switches, "directory")) {
        subdirectory = *value;
    }
    if (auto value = switchValue(switches, "subdirectory")) {
        subdirectory = *value;
    }
    if (auto value = switchValue(switches, "identity")) {
        identity = *value;
    }
    if (auto value = switchValue(switches, "authentication")) {
        auto mode = parseAuthMode(*value);
        if (!mode) {
            return std::unexpected(makeError(ErrorKind::Precondition,
                "Unknown authentication method: " + *value + " (use agent, keyfile or password)"));
        }
        authentication = *mode;
    }
    return {};
}

int StagingEndpoint::effectivePort() const {
    if (port > 0) {
        return port;
    }
    return protocol == Protocol::Sftp ? 22 : 21;
}

std::string StagingEndpoint::hostPart() const {
    std::string part = user.empty() ? host : user + "@" + host;
    if (port > 0 && port != (protocol == Protocol::Sftp ? 22 : 21)) {
        part += ":" + std::to_string(port);
    }
    return part;
}

std::string StagingEndpoint::url(const std::string& path) const {
    std::string suffix = path;
    if (suffix.empty() || suffix.front() != '/') {
        suffix = "/" + suffix;
    }
    return std::string(protocolName(protocol)) + "://" + hostPart() + suffix;
}

std::optional<std::string> resolveIdentityFile(const std::optional<std::string>& explicitPath,
                                               const fs::path& home) {
    if (explicitPath && !explicitPath->empty()) {
        return explicitPath;
    }
    for (const char* candidate : {"id_rsa", "id_dsa", "identity"}) {
        fs::path path = home / ".ssh" / candidate;
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return path.string();
        }
    }
    return std::nullopt;
}

std::expected<void, StagingError> checkHostKey(HostKeyStatus status,
                                               const StagingEndpoint& endpoint,
                                               const std::string& detail) {
    std::string keyscan = "ssh-keyscan -p " + std::to_string(endpoint.effectivePort()) + " " + endpoint.host +
                          " >> ~/.ssh/known_hosts";
    switch (status) {
    case HostKeyStatus::Known:
        return {};
    case HostKeyStatus::Unknown: {
        StagingError error = makeError(ErrorKind::Connection, "Host key for " + endpoint.host + " is not in known_hosts");
        error.remedy = "Verify the server's fingerprint, then add it: " + keyscan;
        return std::unexpected(error);
    }
    case HostKeyStatus::Changed: {
        StagingError error = makeError(ErrorKind::Connection,
            "Host key for " + endpoint.host + " does not match the one in known_hosts");
        error.remedy = "The server key changed or the connection is intercepted; confirm with the server administrator.";
        return std::unexpected(error);
    }
    case HostKeyStatus::Error:
        break;
    }
    return std::unexpected(makeError(ErrorKind::Protocol, "Host key check failed: " + detail));
}
