/**
 * @file credential.hpp
 * @brief Credential attempts tried by the authentication resolver.
 *
 * A CredentialAttempt is a pure description of one way to log in: a key held
 * by a running agent, a private key file, or a password. Invoking it against a
 * connector yields either a live transport or a typed failure.
 */

#ifndef CREDENTIAL_HPP
#define CREDENTIAL_HPP

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include "staging_error.hpp"

/**
 * @brief Supplies a secret either from a fixed value or from an interactive prompt.
 *
 * The prompt runs at most once; its answer is remembered for later calls.
 */
class SecretSource {
public:
    using Prompt = std::function<std::optional<std::string>()>;

    SecretSource() = default;

    static SecretSource fixed(std::string value);
    static SecretSource prompted(Prompt prompt);

    /**
     * @brief Returns the secret, prompting when needed.
     * @return The secret, or InvalidCredential when there is neither a value nor an answer.
     */
    std::expected<std::string, StagingError> get() const;

    bool isInteractive() const { return !value_ && static_cast<bool>(prompt_); }
    bool empty() const { return !value_ && !prompt_; }

private:
    mutable std::optional<std::string> value_;
    Prompt prompt_;
};

/**
 * @brief A public key offered by a running SSH agent.
 */
struct AgentKey {
    std::string blob;    ///< Public key blob in SSH wire format.
    std::string comment; ///< Comment the key was added with, usually user@host.
};

/**
 * @brief A private key file and the source of its passphrase, if it has one.
 */
struct PrivateKeyFile {
    std::string path;
    SecretSource passphrase;
};

/**
 * @brief A password login without key material.
 */
struct PasswordCredential {
    SecretSource source;
};

using CredentialAttempt = std::variant<AgentKey, PrivateKeyFile, PasswordCredential>;

/**
 * @brief Human-readable label for diagnostics, e.g. "keyfile /home/me/.ssh/id_rsa".
 */
std::string describeAttempt(const CredentialAttempt& attempt);

#endif // CREDENTIAL_HPP
