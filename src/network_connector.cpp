#include "network_connector.hpp"
#include "ftp_transport.hpp"
#include "sftp_transport.hpp"

std::expected<std::unique_ptr<TransportClient>, StagingError> NetworkConnector::connect(const StagingEndpoint& endpoint,
                                                                                       const CredentialAttempt& attempt) {
    switch (endpoint.protocol) {
    case Protocol::Ftp: {
        const auto* password = std::get_if<PasswordCredential>(&attempt);
        if (!password) {
            return std::unexpected(makeError(ErrorKind::InvalidCredential, "FTP supports password login only"));
        }
        auto secret = password->source.get();
        if (!secret) {
            return std::unexpected(secret.error());
        }
        auto transport = FtpTransport::open(endpoint, *secret, timeoutSeconds_);
        if (!transport) {
            return std::unexpected(transport.error());
        }
        return std::unique_ptr<TransportClient>(std::move(*transport));
    }
    case Protocol::Sftp: {
        auto transport = SftpTransport::open(endpoint, attempt, timeoutSeconds_);
        if (!transport) {
            return std::unexpected(transport.error());
        }
        return std::unique_ptr<TransportClient>(std::move(*transport));
    }
    }
    return std::unexpected(makeError(ErrorKind::Unsupported, "Unknown protocol"));
}
