/**
 * @file transport_client.hpp
 * @brief Protocol-uniform access to the staging server.
 *
 * TransportClient is the single interface the mirror and the orchestrator talk
 * to. Concrete backends (FtpTransport, SftpTransport) only implement the
 * path-based primitives; the public operations, the local/remote location
 * pair and the dry-run guard live here so that no caller ever branches on the
 * protocol.
 *
 * @note The local "current directory" is an explicit path held by the client.
 * The process working directory is never changed.
 */

#ifndef TRANSPORT_CLIENT_HPP
#define TRANSPORT_CLIENT_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "staging_endpoint.hpp"
#include "staging_error.hpp"

/**
 * @brief Kind of a remote directory entry.
 */
enum class EntryKind {
    File,
    Directory,
    Other
};

/**
 * @brief Result of a remote stat.
 */
struct RemoteEntry {
    EntryKind kind = EntryKind::Other;
    std::optional<std::uintmax_t> size; ///< Set for plain files whose size the server reports.
};

/**
 * @brief The local and remote working directories, always changed together.
 */
struct Location {
    std::filesystem::path local;
    std::string remote;

    bool operator==(const Location&) const = default;
};

/**
 * @brief Free-space report for the filesystem holding a remote path.
 */
struct VolumeInfo {
    std::uintmax_t bytesOnDevice = 0;
    std::uintmax_t unusedBytes = 0;
    std::uintmax_t availableBytes = 0;  ///< Unused bytes available to the logged-in user.
    std::uintmax_t blockSize = 0;
    std::uintmax_t totalInodes = 0;
    std::uintmax_t freeInodes = 0;
};

class TransportClient {
public:
    virtual ~TransportClient() = default;

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    virtual Protocol protocol() const = 0;

    /**
     * @brief Closes the connection. Safe to call more than once.
     */
    virtual void close() = 0;

    /**
     * @brief Returns the (local, remote) working directory pair.
     */
    Location getLocation() const { return location_; }

    /**
     * @brief Enters a remote directory.
     *
     * Relative names are resolved against the current remote directory.
     * When the directory does not exist it is created only if @p make is set;
     * otherwise RemoteNotFound is returned with a synthesized URL.
     *
     * @return The previous remote directory.
     */
    std::expected<std::string, StagingError> setRemoteLocation(const std::string& dir, bool make);

    /**
     * @brief Enters a local directory, creating it when @p make is set.
     * @return The previous local directory.
     */
    std::expected<std::filesystem::path, StagingError> setLocalLocation(const std::filesystem::path& dir, bool make);

    /**
     * @brief Puts both sides back to a pair captured earlier. Never touches the network.
     */
    void restoreLocation(const Location& location) { location_ = location; }

    /**
     * @brief Non-throwing existence probe.
     * @return The entry kind, or std::nullopt when nothing is there.
     */
    std::optional<EntryKind> probe(const std::string& name);

    bool isDirectory(const std::string& name);

    /**
     * @return The size of a plain file, or std::nullopt when @p name is not a
     * plain file or does not exist.
     */
    std::optional<std::uintmax_t> getFileSize(const std::string& name);

    /**
     * @brief Names of the entries in the current remote directory, without "." and "..".
     */
    std::expected<std::vector<std::string>, StagingError> getChildItem();

    /**
     * @brief Copies remote @p name into the current local directory under the same name.
     */
    std::expected<void, StagingError> downloadFile(const std::string& name);

    /**
     * @brief Copies local @p name into the current remote directory under the same name.
     * @return Number of bytes sent (the size that would be sent in dry-run).
     */
    std::expected<std::uintmax_t, StagingError> uploadFile(const std::string& name);

    std::expected<void, StagingError> removeItem(const std::string& name);
    std::expected<void, StagingError> newDirectoryItem(const std::string& name);
    std::expected<void, StagingError> removeDirectoryItem(const std::string& name);

    /**
     * @brief Queries free space of the remote filesystem holding @p path.
     * @return Unsupported for backends without an extended statvfs request.
     */
    std::expected<VolumeInfo, StagingError> getVolume(const std::string& path);

    /**
     * @brief Turns every mutating primitive into a no-op.
     */
    void setDryRun(bool dryRun) { dryRun_ = dryRun; }
    bool dryRun() const { return dryRun_; }

    std::string remotePath(const std::string& name) const;
    std::filesystem::path localPath(const std::string& name) const;

    /**
     * @brief URL of a remote path, e.g. "sftp://bob@host/Lockss/au".
     */
    std::string url(const std::string& path) const;
    std::string url() const { return url(location_.remote); }

protected:
    TransportClient(StagingEndpoint endpoint, Location start);

    const StagingEndpoint& endpoint() const { return endpoint_; }

    /**
     * @name Backend primitives
     * All paths are absolute remote paths. Implementations never see dry-run
     * requests: the public operations filter them out first.
     */
    ///@{
    virtual std::optional<RemoteEntry> statRemote(const std::string& path) = 0;
    virtual std::expected<std::vector<std::string>, StagingError> listRemote(const std::string& path) = 0;
    virtual std::expected<void, StagingError> makeRemoteDirectory(const std::string& path) = 0;
    virtual std::expected<void, StagingError> removeRemoteDirectory(const std::string& path) = 0;
    virtual std::expected<void, StagingError> removeRemoteFile(const std::string& path) = 0;
    virtual std::expected<void, StagingError> retrieve(const std::string& remotePath,
                                                       const std::filesystem::path& localPath) = 0;
    virtual std::expected<void, StagingError> store(const std::filesystem::path& localPath,
                                                    const std::string& remotePath) = 0;
    virtual std::expected<VolumeInfo, StagingError> statVolume(const std::string& path);
    ///@}

private:
    StagingEndpoint endpoint_;
    Location location_;
    bool dryRun_ = false;
};

/**
 * @brief Joins a remote directory and a name, resolving ".", ".." and absolute names.
 */
std::string joinRemotePath(const std::string& base, const std::string& name);

#endif // TRANSPORT_CLIENT_HPP
