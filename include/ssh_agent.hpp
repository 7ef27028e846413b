/**
 * @file ssh_agent.hpp
 * @brief Access to keys held by a running SSH agent.
 */

#ifndef SSH_AGENT_HPP
#define SSH_AGENT_HPP

#include <string>
#include <vector>
#include "credential.hpp"

/**
 * @brief Interface for listing the identities of a key agent.
 */
class KeyAgent {
public:
    virtual ~KeyAgent() = default;

    /**
     * @brief Lists the public keys the agent currently holds.
     *
     * An unreachable agent is not an error: it simply holds no keys.
     *
     * @return Zero or more keys, in the order the agent reports them.
     */
    virtual std::vector<AgentKey> listIdentities() = 0;
};

/**
 * @brief Talks the ssh-agent protocol over the socket named by SSH_AUTH_SOCK.
 *
 * Only the request-identities message is used; signing stays with libssh,
 * which reaches the same agent during authentication.
 */
class SshAgentClient : public KeyAgent {
public:
    /**
     * @param socketPath Agent socket; empty means read SSH_AUTH_SOCK.
     */
    explicit SshAgentClient(std::string socketPath = {});

    std::vector<AgentKey> listIdentities() override;

    /**
     * @brief Decodes an SSH2_AGENT_IDENTITIES_ANSWER body.
     *
     * @param reply Message bytes after the length prefix, starting with the type byte.
     * @return The keys, or an empty list for a malformed or unexpected reply.
     */
    static std::vector<AgentKey> parseIdentitiesAnswer(const std::string& reply);

private:
    std::string socketPath_;
};

#endif // SSH_AGENT_HPP
