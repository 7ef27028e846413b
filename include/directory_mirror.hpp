/**
 * @file directory_mirror.hpp
 * @brief Recursive mirroring of a directory tree between local and remote.
 *
 * Download moves remote content into the current local directory and purges
 * each remote file only after its local copy is verified. Upload copies the
 * local tree to the remote side and skips files whose remote size already
 * matches, so a second run moves zero bytes.
 */

#ifndef DIRECTORY_MIRROR_HPP
#define DIRECTORY_MIRROR_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>
#include "transfer_event.hpp"
#include "transfer_session.hpp"

using ExcludePredicate = std::function<bool(const std::string&)>;

/**
 * @brief Counters collected over one or more mirror runs.
 */
struct MirrorStats {
    std::uintmax_t filesUploaded = 0;
    std::uintmax_t bytesUploaded = 0;
    std::uintmax_t filesDownloaded = 0;
    std::uintmax_t bytesDownloaded = 0;
    std::uintmax_t filesSkipped = 0;    ///< Uploads skipped because the remote copy already matches.
    std::uintmax_t filesRemoved = 0;    ///< Remote files purged after a verified download.
    std::uintmax_t filesKept = 0;       ///< Remote files left in place after an unverified download.
    std::uintmax_t itemsExcluded = 0;
};

struct MirrorOptions {
    /**
     * @brief Treat every downloaded file as verified and purge it remotely
     * without comparing sizes. Only for trusted re-runs.
     */
    bool skipVerification = false;
};

class DirectoryMirror {
public:
    DirectoryMirror(TransferSession& session, ExcludePredicate exclude, EventSink sink, MirrorOptions options = {});

    /**
     * @brief Mirrors remote @p name into the current local directory, then purges it remotely.
     *
     * "." mirrors the contents of the current directory pair without entering
     * or removing anything. Children named manifest* are always visited first.
     */
    std::expected<void, StagingError> download(const std::string& name);

    /**
     * @brief Mirrors local @p name into the current remote directory.
     *
     * "." mirrors the contents of the current directory pair.
     */
    std::expected<void, StagingError> upload(const std::string& name);

    const MirrorStats& stats() const { return stats_; }

    /**
     * @brief Moves names matching manifest* (any case) ahead of their siblings,
     * keeping the relative order inside both groups.
     */
    static void orderManifestFirst(std::vector<std::string>& names);

private:
    std::expected<void, StagingError> downloadChildren();
    std::expected<void, StagingError> downloadDirectory(const std::string& name);
    std::expected<void, StagingError> downloadOne(const std::string& name);

    std::expected<void, StagingError> uploadChildren();
    std::expected<void, StagingError> uploadDirectory(const std::string& name);
    std::expected<void, StagingError> uploadOne(const std::string& name);

    void emit(int level, EventKind kind, Json::Value payload);
    void emitChdir();

    TransferSession& session_;
    ExcludePredicate exclude_;
    EventSink sink_;
    MirrorOptions options_;
    MirrorStats stats_;
};

#endif // DIRECTORY_MIRROR_HPP
