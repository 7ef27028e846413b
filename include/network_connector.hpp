/**
 * @file network_connector.hpp
 * @brief Production Connector: the one place that picks a backend by protocol.
 */

#ifndef NETWORK_CONNECTOR_HPP
#define NETWORK_CONNECTOR_HPP

#include "authentication_resolver.hpp"

class NetworkConnector : public Connector {
public:
    /**
     * @param timeoutSeconds Connect and stall timeout handed to the backend.
     */
    explicit NetworkConnector(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {}

    /**
     * @brief Opens an FtpTransport or an SftpTransport for the attempt.
     *
     * FTP accepts only password attempts; anything else is reported as an
     * InvalidCredential so the resolver moves on.
     */
    std::expected<std::unique_ptr<TransportClient>, StagingError> connect(const StagingEndpoint& endpoint,
                                                                          const CredentialAttempt& attempt) override;

private:
    long timeoutSeconds_;
};

#endif // NETWORK_CONNECTOR_HPP
