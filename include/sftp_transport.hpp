/**
 * @file sftp_transport.hpp
 * @brief SFTP backend of the transport client, built on libssh.
 *
 * Each instance owns one SSH session and one SFTP channel on it. Agent keys,
 * private key files and passwords are all accepted as credentials.
 *
 * @note Requires libssh 0.9 or newer. Install via apt (libssh-dev) on Linux
 * or Homebrew on macOS.
 */

#ifndef SFTP_TRANSPORT_HPP
#define SFTP_TRANSPORT_HPP

#include <memory>
#include <string>
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include "credential.hpp"
#include "transport_client.hpp"

class SftpTransport : public TransportClient {
public:
    /**
     * @brief Connects, verifies the host key and authenticates with one credential.
     *
     * @param endpoint Host, port and user to connect as.
     * @param credential The single credential to authenticate with.
     * @param timeoutSeconds Timeout applied to connect and to every blocking call.
     * @return A connected transport positioned at the login directory, or the
     * failure of this one attempt.
     */
    static std::expected<std::unique_ptr<SftpTransport>, StagingError> open(const StagingEndpoint& endpoint,
                                                                            const CredentialAttempt& credential,
                                                                            long timeoutSeconds);

private:
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * @brief Takes ownership of @p session and @p sftp. Only open() can construct.
     */
    SftpTransport(Passkey, const StagingEndpoint& endpoint, Location start, ssh_session session, sftp_session sftp);
    ~SftpTransport() override;

    Protocol protocol() const override { return Protocol::Sftp; }
    void close() override;

protected:
    std::optional<RemoteEntry> statRemote(const std::string& path) override;
    std::expected<std::vector<std::string>, StagingError> listRemote(const std::string& path) override;
    std::expected<void, StagingError> makeRemoteDirectory(const std::string& path) override;
    std::expected<void, StagingError> removeRemoteDirectory(const std::string& path) override;
    std::expected<void, StagingError> removeRemoteFile(const std::string& path) override;
    std::expected<void, StagingError> retrieve(const std::string& remotePath,
                                               const std::filesystem::path& localPath) override;
    std::expected<void, StagingError> store(const std::filesystem::path& localPath,
                                            const std::string& remotePath) override;
    std::expected<VolumeInfo, StagingError> statVolume(const std::string& path) override;

private:

    StagingError sftpError(const std::string& what, const std::string& path) const;

    ssh_session session_;
    sftp_session sftp_;
};

#endif // SFTP_TRANSPORT_HPP
