#include "transport_client.hpp"
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

std::string joinRemotePath(const std::string& base, const std::string& name) {
    std::vector<std::string> parts;
    auto push = [&parts](const std::string& path) {
        std::stringstream stream(path);
        std::string segment;
        while (std::getline(stream, segment, '/')) {
            if (segment.empty() || segment == ".") {
                continue;
            }
            if (segment == "..") {
                if (!parts.empty()) {
                    parts.pop_back();
                }
                continue;
            }
            parts.push_back(segment);
        }
    };

    if (name.empty() || name.front() != '/') {
        push(base);
    }
    push(name);

    std::string joined;
    for (const auto& part : parts) {
        joined += "/" + part;
    }
    return joined.empty() ? "/" : joined;
}

TransportClient::TransportClient(StagingEndpoint endpoint, Location start)
    : endpoint_(std::move(endpoint)), location_(std::move(start)) {}

std::string TransportClient::remotePath(const std::string& name) const {
    return joinRemotePath(location_.remote, name);
}

fs::path TransportClient::localPath(const std::string& name) const {
    return (location_.local / name).lexically_normal();
}

std::string TransportClient::url(const std::string& path) const {
    return endpoint_.url(path);
}

std::expected<std::string, StagingError> TransportClient::setRemoteLocation(const std::string& dir, bool make) {
    std::string previous = location_.remote;
    std::string target = remotePath(dir);

    auto entry = statRemote(target);
    if (!entry || entry->kind != EntryKind::Directory) {
        if (!make) {
            return std::unexpected(remoteNotFound(target, url(target)));
        }
        if (entry) {
            return std::unexpected(makeError(ErrorKind::Filesystem,
                "Remote path exists and is not a directory: " + url(target)));
        }
        if (!dryRun_) {
            auto made = newDirectoryItem(dir);
            if (!made) {
                return std::unexpected(made.error());
            }
            auto retry = statRemote(target);
            if (!retry || retry->kind != EntryKind::Directory) {
                return std::unexpected(remoteNotFound(target, url(target)));
            }
        }
    }

    location_.remote = target;
    return previous;
}

std::expected<fs::path, StagingError> TransportClient::setLocalLocation(const fs::path& dir, bool make) {
    fs::path previous = location_.local;
    fs::path target = dir.is_absolute() ? dir.lexically_normal() : (location_.local / dir).lexically_normal();

    std::error_code ec;
    if (!fs::is_directory(target, ec)) {
        if (!make) {
            return std::unexpected(makeError(ErrorKind::Filesystem, "Local directory not found: " + target.string()));
        }
        if (!dryRun_) {
            fs::create_directories(target, ec);
            if (ec) {
                return std::unexpected(makeError(ErrorKind::Filesystem,
                    "Failed to create local directory " + target.string() + ": " + ec.message()));
            }
        }
    }

    location_.local = target;
    return previous;
}

std::optional<EntryKind> TransportClient::probe(const std::string& name) {
    auto entry = statRemote(remotePath(name));
    if (!entry) {
        return std::nullopt;
    }
    return entry->kind;
}

bool TransportClient::isDirectory(const std::string& name) {
    return probe(name) == EntryKind::Directory;
}

std::optional<std::uintmax_t> TransportClient::getFileSize(const std::string& name) {
    auto entry = statRemote(remotePath(name));
    if (!entry || entry->kind != EntryKind::File) {
        return std::nullopt;
    }
    return entry->size;
}

std::expected<std::vector<std::string>, StagingError> TransportClient::getChildItem() {
    if (dryRun_) {
        // A directory that a dry run only pretended to create has no children.
        auto entry = statRemote(location_.remote);
        if (!entry || entry->kind != EntryKind::Directory) {
            return std::vector<std::string>{};
        }
    }
    return listRemote(location_.remote);
}

std::expected<void, StagingError> TransportClient::downloadFile(const std::string& name) {
    if (dryRun_) {
        return {};
    }
    return retrieve(remotePath(name), localPath(name));
}

std::expected<std::uintmax_t, StagingError> TransportClient::uploadFile(const std::string& name) {
    fs::path source = localPath(name);
    std::error_code ec;
    std::uintmax_t size = fs::file_size(source, ec);
    if (ec) {
        return std::unexpected(makeError(ErrorKind::Filesystem,
            "Cannot read local file " + source.string() + ": " + ec.message()));
    }
    if (dryRun_) {
        return size;
    }
    auto stored = store(source, remotePath(name));
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return size;
}

std::expected<void, StagingError> TransportClient::removeItem(const std::string& name) {
    if (dryRun_) {
        return {};
    }
    return removeRemoteFile(remotePath(name));
}

std::expected<void, StagingError> TransportClient::newDirectoryItem(const std::string& name) {
    if (dryRun_) {
        return {};
    }
    return makeRemoteDirectory(remotePath(name));
}

std::expected<void, StagingError> TransportClient::removeDirectoryItem(const std::string& name) {
    if (dryRun_) {
        return {};
    }
    return removeRemoteDirectory(remotePath(name));
}

std::expected<VolumeInfo, StagingError> TransportClient::getVolume(const std::string& path) {
    return statVolume(remotePath(path));
}

std::expected<VolumeInfo, StagingError> TransportClient::statVolume(const std::string& /*path*/) {
    return std::unexpected(makeError(ErrorKind::Unsupported,
        std::string("Free-space query is not available over ") + protocolName(protocol())));
}
