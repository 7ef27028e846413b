#include "ftp_transport.hpp"
#include "interrupt.hpp"
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

size_t writeToStream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ostream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

size_t writeToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t readFromStream(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* in = static_cast<std::istream*>(userdata);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    return static_cast<size_t>(in->gcount());
}

int abortOnShutdown(void* /*clientp*/, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return shutdownRequested() ? 1 : 0;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

ErrorKind classify(CURLcode code) {
    switch (code) {
    case CURLE_LOGIN_DENIED:
        return ErrorKind::Authentication;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorKind::Connection;
    case CURLE_REMOTE_FILE_NOT_FOUND:
    case CURLE_REMOTE_ACCESS_DENIED:
        return ErrorKind::RemoteNotFound;
    case CURLE_ABORTED_BY_CALLBACK:
        return ErrorKind::Interrupted;
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR:
    case CURLE_UPLOAD_FAILED:
    case CURLE_QUOTE_ERROR:
        return ErrorKind::Filesystem;
    default:
        return ErrorKind::Protocol;
    }
}

} // namespace

std::expected<std::unique_ptr<FtpTransport>, StagingError> FtpTransport::open(const StagingEndpoint& endpoint,
                                                                             const std::string& password,
                                                                             long timeoutSeconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(makeError(ErrorKind::Connection, "Failed to initialize CURL"));
    }
    auto transport = std::make_unique<FtpTransport>(Passkey{}, endpoint, Location{fs::current_path(), "/"}, curl,
                                                    password, timeoutSeconds);

    // Log in against the login directory and learn where it is.
    transport->prepare("/", true);
    std::string loginUrl = "ftp://" + endpoint.host + ":" + std::to_string(endpoint.effectivePort()) + "/";
    curl_easy_setopt(curl, CURLOPT_URL, loginUrl.c_str());
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(transport->transferError(res, "FTP login", "/"));
    }

    const char* entryPath = nullptr;
    curl_easy_getinfo(curl, CURLINFO_FTP_ENTRY_PATH, &entryPath);
    std::string start = entryPath && entryPath[0] == '/' ? entryPath : "/";
    transport->restoreLocation(Location{fs::current_path(), joinRemotePath("/", start)});
    return transport;
}

FtpTransport::FtpTransport(Passkey, const StagingEndpoint& endpoint, Location start, CURL* curl, std::string password,
                           long timeoutSeconds)
    : TransportClient(endpoint, std::move(start)),
      curl_(curl),
      password_(std::move(password)),
      timeoutSeconds_(timeoutSeconds) {
    errorBuffer_[0] = '\0';
}

FtpTransport::~FtpTransport() {
    close();
}

void FtpTransport::close() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

std::string FtpTransport::requestUrl(const std::string& path, bool directory) const {
    // "%2F" makes the path absolute instead of relative to the login directory.
    std::string url = "ftp://" + endpoint().host + ":" + std::to_string(endpoint().effectivePort()) + "/%2F";
    std::stringstream stream(path);
    std::string segment;
    bool first = true;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        char* escaped = curl_easy_escape(curl_, segment.c_str(), static_cast<int>(segment.size()));
        url += (first ? "" : "/") + std::string(escaped ? escaped : segment.c_str());
        curl_free(escaped);
        first = false;
    }
    if (directory) {
        url += "/";
    }
    return url;
}

void FtpTransport::prepare(const std::string& path, bool directory) {
    curl_easy_reset(curl_);
    errorBuffer_[0] = '\0';
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(curl_, CURLOPT_URL, requestUrl(path, directory).c_str());
    if (!endpoint().user.empty()) {
        curl_easy_setopt(curl_, CURLOPT_USERNAME, endpoint().user.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, timeoutSeconds_);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abortOnShutdown);
}

StagingError FtpTransport::transferError(CURLcode code, const std::string& what, const std::string& path) const {
    std::string detail = errorBuffer_[0] != '\0' ? errorBuffer_ : curl_easy_strerror(code);
    StagingError error = makeError(classify(code), what + " failed: " + detail);
    error.url = url(path);
    return error;
}

std::optional<RemoteEntry> FtpTransport::statRemote(const std::string& path) {
    if (!curl_) {
        return std::nullopt;
    }

    // A directory is anything the server lets us CWD into.
    prepare(path, true);
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (curl_easy_perform(curl_) == CURLE_OK) {
        return RemoteEntry{EntryKind::Directory, std::nullopt};
    }

    prepare(path, false);
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    CURLcode res = curl_easy_perform(curl_);
    curl_off_t length = -1;
    curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0) {
        return RemoteEntry{EntryKind::File, static_cast<std::uintmax_t>(length)};
    }
    if (res == CURLE_OK) {
        return RemoteEntry{EntryKind::Other, std::nullopt};
    }
    return std::nullopt;
}

std::expected<std::vector<std::string>, StagingError> FtpTransport::listRemote(const std::string& path) {
    std::string listing;
    prepare(path, true);
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &listing);
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(transferError(res, "Listing", path));
    }

    std::vector<std::string> names;
    std::stringstream stream(listing);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Some servers answer NLST with full paths.
        auto slash = line.find_last_of('/');
        if (slash != std::string::npos) {
            line = line.substr(slash + 1);
        }
        if (line.empty() || line == "." || line == "..") {
            continue;
        }
        names.push_back(line);
    }
    return names;
}

std::expected<void, StagingError> FtpTransport::runCommand(const std::string& command, const std::string& path) {
    std::unique_ptr<curl_slist, SlistDeleter> commands(curl_slist_append(nullptr, (command + " " + path).c_str()));
    prepare("/", true);
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, commands.get());
    CURLcode res = curl_easy_perform(curl_);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, nullptr);
    if (res != CURLE_OK) {
        return std::unexpected(transferError(res, command, path));
    }
    return {};
}

std::expected<void, StagingError> FtpTransport::makeRemoteDirectory(const std::string& path) {
    return runCommand("MKD", path);
}

std::expected<void, StagingError> FtpTransport::removeRemoteDirectory(const std::string& path) {
    return runCommand("RMD", path);
}

std::expected<void, StagingError> FtpTransport::removeRemoteFile(const std::string& path) {
    return runCommand("DELE", path);
}

std::expected<void, StagingError> FtpTransport::retrieve(const std::string& remotePath, const fs::path& localPath) {
    std::ofstream output(localPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to open local file: " + localPath.string()));
    }
    prepare(remotePath, false);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, static_cast<std::ostream*>(&output));
    CURLcode res = curl_easy_perform(curl_);
    output.close();
    if (res != CURLE_OK) {
        return std::unexpected(transferError(res, "RETR", remotePath));
    }
    return {};
}

std::expected<void, StagingError> FtpTransport::store(const fs::path& localPath, const std::string& remotePath) {
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to open local file: " + localPath.string()));
    }
    std::error_code ec;
    auto size = fs::file_size(localPath, ec);

    prepare(remotePath, false);
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromStream);
    curl_easy_setopt(curl_, CURLOPT_READDATA, static_cast<std::istream*>(&input));
    if (!ec) {
        curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    }
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(transferError(res, "STOR", remotePath));
    }
    return {};
}
