#include "authentication_resolver.hpp"
#include "interrupt.hpp"
#include <utility>

AuthenticationResolver::AuthenticationResolver(StagingEndpoint endpoint,
                                               std::shared_ptr<KeyAgent> agent,
                                               SecretSource::Prompt passwordPrompt,
                                               SecretSource::Prompt passphrasePrompt,
                                               std::filesystem::path home)
    : endpoint_(std::move(endpoint)),
      agent_(std::move(agent)),
      passwordPrompt_(std::move(passwordPrompt)),
      passphrasePrompt_(std::move(passphrasePrompt)),
      home_(std::move(home)) {}

SecretSource AuthenticationResolver::passwordSource() const {
    if (endpoint_.password) {
        return SecretSource::fixed(*endpoint_.password);
    }
    return SecretSource::prompted(passwordPrompt_);
}

std::vector<CredentialAttempt> AuthenticationResolver::buildAttempts() const {
    std::vector<CredentialAttempt> attempts;
    if (!supportsKeyAuthentication(endpoint_.protocol)) {
        attempts.emplace_back(PasswordCredential{passwordSource()});
        return attempts;
    }

    AuthMode mode = endpoint_.authentication;
    if ((mode == AuthMode::Unspecified || mode == AuthMode::Agent) && agent_) {
        for (auto& key : agent_->listIdentities()) {
            attempts.emplace_back(std::move(key));
        }
    }
    if (mode == AuthMode::Unspecified || mode == AuthMode::KeyFile) {
        if (auto identity = resolveIdentityFile(endpoint_.identity, home_)) {
            attempts.emplace_back(PrivateKeyFile{*identity, SecretSource::prompted(passphrasePrompt_)});
        }
    }
    if (mode == AuthMode::Unspecified || mode == AuthMode::Password) {
        attempts.emplace_back(PasswordCredential{passwordSource()});
    }
    return attempts;
}

std::expected<TransferSession, StagingError> AuthenticationResolver::openConnection(Connector& connector) const {
    std::vector<AuthFailure> failures;

    for (const auto& attempt : buildAttempts()) {
        if (shutdownRequested()) {
            return std::unexpected(interrupted());
        }
        std::string description = describeAttempt(attempt);
        auto transport = connector.connect(endpoint_, attempt);
        if (transport) {
            return TransferSession(std::move(*transport), description);
        }

        const StagingError& error = transport.error();
        failures.push_back({description, error.message});
        switch (error.kind) {
        case ErrorKind::Authentication:
        case ErrorKind::InvalidCredential:
        case ErrorKind::Protocol:
            continue;
        case ErrorKind::Interrupted:
            return std::unexpected(error);
        default:
            break;
        }
        if (shutdownRequested()) {
            return std::unexpected(interrupted());
        }
        StagingError fatal = makeError(ErrorKind::Connection, "Could not connect to " + endpoint_.url(endpoint_.baseDir));
        fatal.remedy = error.remedy;
        fatal.attempts = std::move(failures);
        return std::unexpected(fatal);
    }

    // A prompt cut short by Ctrl-C fails like a bad credential.
    if (shutdownRequested()) {
        return std::unexpected(interrupted());
    }
    StagingError error = makeError(ErrorKind::Connection,
        failures.empty() ? "No authentication method available for " + endpoint_.hostPart()
                         : "Every authentication attempt failed for " + endpoint_.hostPart());
    error.attempts = std::move(failures);
    error.remedy = "Check the user name, key and password, or choose a method with --authentication.";
    return std::unexpected(error);
}
