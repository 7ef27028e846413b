#include "credential.hpp"
#include <utility>

SecretSource SecretSource::fixed(std::string value) {
    SecretSource source;
    source.value_ = std::move(value);
    return source;
}

SecretSource SecretSource::prompted(Prompt prompt) {
    SecretSource source;
    source.prompt_ = std::move(prompt);
    return source;
}

std::expected<std::string, StagingError> SecretSource::get() const {
    if (!value_ && prompt_) {
        value_ = prompt_();
    }
    if (!value_) {
        return std::unexpected(makeError(ErrorKind::InvalidCredential, "No secret was supplied"));
    }
    return *value_;
}

namespace {

struct AttemptDescriber {
    std::string operator()(const AgentKey& key) const {
        return "agent key (" + (key.comment.empty() ? std::string("no comment") : key.comment) + ")";
    }
    std::string operator()(const PrivateKeyFile& key) const {
        return "keyfile " + key.path;
    }
    std::string operator()(const PasswordCredential& password) const {
        return password.source.isInteractive() ? "password (prompt)" : "password";
    }
};

} // namespace

std::string describeAttempt(const CredentialAttempt& attempt) {
    return std::visit(AttemptDescriber{}, attempt);
}
