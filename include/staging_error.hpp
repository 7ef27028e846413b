/**
 * @file staging_error.hpp
 * @brief Error taxonomy for the ArchiveStager transfer engine.
 *
 * Every fallible engine operation returns std::expected<T, StagingError>. The
 * top-level tools convert the kind into a process exit code and print a single
 * diagnostic on stderr.
 */

#ifndef STAGING_ERROR_HPP
#define STAGING_ERROR_HPP

#include <string>
#include <vector>

/**
 * @brief Broad category of a staging failure.
 */
enum class ErrorKind {
    Connection,         ///< Every authentication attempt failed, or the host is unreachable.
    Authentication,     ///< The server rejected one credential.
    InvalidCredential,  ///< A credential could not be used (unreadable key, bad passphrase).
    Protocol,           ///< The remote side spoke something unexpected.
    Precondition,       ///< The local package fails a required check.
    RemoteNotFound,     ///< A required remote directory or file is absent.
    Filesystem,         ///< A local or remote filesystem call failed.
    Unsupported,        ///< The backend cannot perform the request.
    Interrupted         ///< The user pressed Ctrl-C.
};

/**
 * @brief One failed authentication attempt.
 */
struct AuthFailure {
    std::string attempt; ///< Description of the credential tried, e.g. "agent key (me@laptop)".
    std::string cause;   ///< What the server or the client library reported.
};

/**
 * @brief A typed staging failure.
 */
struct StagingError {
    ErrorKind kind = ErrorKind::Filesystem;
    std::string message;
    std::string remedy;                 ///< Optional hint for the user (preconditions).
    std::string url;                    ///< Optional synthesized URL of the remote object.
    std::vector<AuthFailure> attempts;  ///< Populated for ErrorKind::Connection.

    /**
     * @brief Renders the error as a single, possibly multi-line, diagnostic.
     */
    std::string describe() const;
};

StagingError makeError(ErrorKind kind, std::string message);
StagingError remoteNotFound(const std::string& what, const std::string& url);
StagingError interrupted();

/**
 * @brief Maps an error kind onto the process exit code of the staging tools.
 *
 * 1 for connection and authentication failures, 2 for failed preconditions,
 * 255 for a user interrupt and 3 for anything that went wrong after connecting.
 */
int exitCodeFor(const StagingError& error);

const char* errorKindName(ErrorKind kind);

#endif // STAGING_ERROR_HPP
