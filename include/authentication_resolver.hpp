/**
 * @file authentication_resolver.hpp
 * @brief Turns a StagingEndpoint into an ordered credential list and a live session.
 *
 * For protocols with key-based authentication the order is: every key held by
 * the running agent, then the resolved identity file, then a password. FTP
 * gets exactly one attempt, a password. The first attempt that succeeds wins;
 * when all of them fail, one Connection error lists every attempt with its
 * cause, since the real problem is often an early mismatch rather than the
 * last password.
 */

#ifndef AUTHENTICATION_RESOLVER_HPP
#define AUTHENTICATION_RESOLVER_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "credential.hpp"
#include "ssh_agent.hpp"
#include "staging_endpoint.hpp"
#include "transfer_session.hpp"
#include "transport_client.hpp"

/**
 * @brief Opens a transport for one credential attempt.
 *
 * The production implementation (NetworkConnector) picks the backend from the
 * endpoint's protocol; tests substitute their own.
 */
class Connector {
public:
    virtual ~Connector() = default;

    virtual std::expected<std::unique_ptr<TransportClient>, StagingError> connect(const StagingEndpoint& endpoint,
                                                                                  const CredentialAttempt& attempt) = 0;
};

class AuthenticationResolver {
public:
    /**
     * @param endpoint Where to connect.
     * @param agent Source of agent keys; may be null when no agent should be used.
     * @param passwordPrompt Asked for the password when none was given explicitly.
     * @param passphrasePrompt Asked for a key file passphrase, only if the key is encrypted.
     * @param home Home directory used to probe for default identity files.
     */
    AuthenticationResolver(StagingEndpoint endpoint,
                           std::shared_ptr<KeyAgent> agent,
                           SecretSource::Prompt passwordPrompt,
                           SecretSource::Prompt passphrasePrompt,
                           std::filesystem::path home);

    /**
     * @brief Builds the ordered list of attempts for the endpoint.
     *
     * An explicit --authentication choice narrows the list to that method.
     */
    std::vector<CredentialAttempt> buildAttempts() const;

    /**
     * @brief Tries each attempt in order and returns the first session that opens.
     *
     * Authentication, credential and protocol failures are recorded and the
     * next attempt is tried. Any other failure (host unreachable, interrupt)
     * stops the loop at once.
     *
     * @return The open session, or a Connection error carrying one entry per
     * attempt that was made.
     */
    std::expected<TransferSession, StagingError> openConnection(Connector& connector) const;

    const StagingEndpoint& endpoint() const { return endpoint_; }

private:
    SecretSource passwordSource() const;

    StagingEndpoint endpoint_;
    std::shared_ptr<KeyAgent> agent_;
    SecretSource::Prompt passwordPrompt_;
    SecretSource::Prompt passphrasePrompt_;
    std::filesystem::path home_;
};

#endif // AUTHENTICATION_RESOLVER_HPP
