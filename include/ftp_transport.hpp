/**
 * @file ftp_transport.hpp
 * @brief FTP backend of the transport client, built on libcurl.
 *
 * libcurl is stateless per request, so the remote working directory is kept
 * by TransportClient and every request addresses an absolute path. The easy
 * handle is reused between requests, which keeps the control connection open.
 *
 * @note Requires libcurl built with FTP support.
 */

#ifndef FTP_TRANSPORT_HPP
#define FTP_TRANSPORT_HPP

#include <memory>
#include <string>
#include <curl/curl.h>
#include "transport_client.hpp"

class FtpTransport : public TransportClient {
public:
    /**
     * @brief Logs in to the FTP server.
     *
     * @param endpoint Host, port and user to connect as.
     * @param password Password to send; FTP has no key-based login.
     * @param timeoutSeconds Connect timeout, also used as the stall timeout of transfers.
     * @return A connected transport positioned at the login directory, or
     * Authentication when the server refuses the login, Connection when it
     * cannot be reached.
     */
    static std::expected<std::unique_ptr<FtpTransport>, StagingError> open(const StagingEndpoint& endpoint,
                                                                           const std::string& password,
                                                                           long timeoutSeconds);

    ~FtpTransport() override;

    Protocol protocol() const override { return Protocol::Ftp; }
    void close() override;

private:
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * @brief Takes ownership of @p curl. Only open() can construct.
     */
    FtpTransport(Passkey, const StagingEndpoint& endpoint, Location start, CURL* curl, std::string password,
                 long timeoutSeconds);

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

private:

    /**
     * @brief Resets the handle and applies the options every request needs.
     */
    void prepare(const std::string& path, bool directory);
    std::string requestUrl(const std::string& path, bool directory) const;
    std::expected<void, StagingError> runCommand(const std::string& command, const std::string& path);
    StagingError transferError(CURLcode code, const std::string& what, const std::string& path) const;

    CURL* curl_;
    std::string password_;
    long timeoutSeconds_;
    char errorBuffer_[CURL_ERROR_SIZE];
};

#endif // FTP_TRANSPORT_HPP
