#include "directory_mirror.hpp"
#include "interrupt.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

bool isManifestName(const std::string& name) {
    static const std::string prefix = "manifest";
    if (name.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(name[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

DirectoryMirror::DirectoryMirror(TransferSession& session, ExcludePredicate exclude, EventSink sink, MirrorOptions options)
    : session_(session), exclude_(std::move(exclude)), sink_(std::move(sink)), options_(options) {}

void DirectoryMirror::orderManifestFirst(std::vector<std::string>& names) {
    std::stable_partition(names.begin(), names.end(), isManifestName);
}

void DirectoryMirror::emit(int level, EventKind kind, Json::Value payload) {
    if (!sink_) {
        return;
    }
    TransferEvent event;
    event.level = level;
    event.kind = kind;
    event.payload = std::move(payload);
    event.dryRun = session_.dryRun();
    sink_(event);
}

void DirectoryMirror::emitChdir() {
    Location here = session_.location();
    Json::Value payload(Json::arrayValue);
    payload.append(here.local.string());
    payload.append(here.remote);
    emit(2, EventKind::Chdir, payload);
}

// Download

std::expected<void, StagingError> DirectoryMirror::download(const std::string& name) {
    if (shutdownRequested()) {
        return std::unexpected(interrupted());
    }
    if (name == ".") {
        return downloadChildren();
    }
    if (session_.transport().isDirectory(name)) {
        return downloadDirectory(name);
    }
    return downloadOne(name);
}

std::expected<void, StagingError> DirectoryMirror::downloadChildren() {
    auto children = session_.transport().getChildItem();
    if (!children) {
        return std::unexpected(children.error());
    }
    orderManifestFirst(*children);

    for (const auto& child : *children) {
        if (exclude_ && exclude_(child)) {
            ++stats_.itemsExcluded;
            emit(2, EventKind::Excluded, child);
            continue;
        }
        auto done = download(child);
        if (!done) {
            return done;
        }
    }
    return {};
}

std::expected<void, StagingError> DirectoryMirror::downloadDirectory(const std::string& name) {
    std::uintmax_t leftBefore = stats_.filesKept + stats_.itemsExcluded;
    {
        LocationGuard guard(session_);
        auto entered = session_.setLocation(name, name, true);
        if (!entered) {
            return std::unexpected(entered.error());
        }
        emitChdir();

        auto done = downloadChildren();
        if (!done) {
            return done;
        }
    }
    emitChdir();

    // Whatever stayed behind keeps the directory non-empty until a later run.
    if (stats_.filesKept + stats_.itemsExcluded != leftBefore) {
        return {};
    }
    auto removed = session_.transport().removeDirectoryItem(name);
    if (!removed) {
        return removed;
    }
    emit(1, EventKind::Removed, name);
    return {};
}

std::expected<void, StagingError> DirectoryMirror::downloadOne(const std::string& name) {
    TransportClient& transport = session_.transport();

    std::optional<std::uintmax_t> remoteSize = transport.getFileSize(name);
    auto fetched = transport.downloadFile(name);
    if (!fetched) {
        return fetched;
    }

    std::error_code ec;
    std::optional<std::uintmax_t> localSize;
    if (!session_.dryRun()) {
        std::uintmax_t size = fs::file_size(transport.localPath(name), ec);
        if (!ec) {
            localSize = size;
        }
    }

    ++stats_.filesDownloaded;
    stats_.bytesDownloaded += remoteSize.value_or(localSize.value_or(0));
    emit(1, EventKind::Downloaded, name);

    bool verified = options_.skipVerification || session_.dryRun() ||
                    (remoteSize && localSize && *remoteSize == *localSize);
    if (!verified) {
        ++stats_.filesKept;
        return {};
    }

    auto removed = transport.removeItem(name);
    if (!removed) {
        return removed;
    }
    ++stats_.filesRemoved;
    emit(1, EventKind::Removed, name);
    return {};
}

// Upload

std::expected<void, StagingError> DirectoryMirror::upload(const std::string& name) {
    if (shutdownRequested()) {
        return std::unexpected(interrupted());
    }
    if (name == ".") {
        return uploadChildren();
    }

    fs::path source = session_.transport().localPath(name);
    std::error_code ec;
    if (fs::is_directory(source, ec)) {
        return uploadDirectory(name);
    }
    if (fs::is_regular_file(source, ec)) {
        return uploadOne(name);
    }
    ++stats_.itemsExcluded;
    emit(2, EventKind::Excluded, name);
    return {};
}

std::expected<void, StagingError> DirectoryMirror::uploadChildren() {
    fs::path here = session_.location().local;
    std::vector<std::string> children;
    std::error_code ec;
    for (fs::directory_iterator it(here, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path().filename().string());
    }
    if (ec) {
        return std::unexpected(makeError(ErrorKind::Filesystem,
            "Cannot list local directory " + here.string() + ": " + ec.message()));
    }
    std::sort(children.begin(), children.end());
    orderManifestFirst(children);

    for (const auto& child : children) {
        if (exclude_ && exclude_(child)) {
            ++stats_.itemsExcluded;
            emit(2, EventKind::Excluded, child);
            continue;
        }
        auto done = upload(child);
        if (!done) {
            return done;
        }
    }
    return {};
}

std::expected<void, StagingError> DirectoryMirror::uploadDirectory(const std::string& name) {
    {
        LocationGuard guard(session_);
        auto entered = session_.setLocation(name, name, true);
        if (!entered) {
            return std::unexpected(entered.error());
        }
        emitChdir();

        auto done = uploadChildren();
        if (!done) {
            return done;
        }
    }
    emitChdir();
    return {};
}

std::expected<void, StagingError> DirectoryMirror::uploadOne(const std::string& name) {
    TransportClient& transport = session_.transport();

    std::error_code ec;
    std::uintmax_t localSize = fs::file_size(transport.localPath(name), ec);
    if (ec) {
        return std::unexpected(makeError(ErrorKind::Filesystem,
            "Cannot read local file " + transport.localPath(name).string() + ": " + ec.message()));
    }
    if (transport.getFileSize(name) == localSize) {
        ++stats_.filesSkipped;
        return {};
    }

    auto sent = transport.uploadFile(name);
    if (!sent) {
        return std::unexpected(sent.error());
    }
    ++stats_.filesUploaded;
    stats_.bytesUploaded += *sent;
    emit(1, EventKind::Uploaded, name);
    return {};
}
