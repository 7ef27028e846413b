#include "sftp_transport.hpp"
#include "interrupt.hpp"
#include <fcntl.h>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr size_t kBlockSize = 32 * 1024;

struct KeyDeleter {
    void operator()(ssh_key_struct* key) const { ssh_key_free(key); }
};
using KeyHandle = std::unique_ptr<ssh_key_struct, KeyDeleter>;

StagingError authError(ssh_session session, int rc, const std::string& what) {
    if (rc == SSH_AUTH_ERROR) {
        return makeError(ErrorKind::Protocol, what + ": " + ssh_get_error(session));
    }
    return makeError(ErrorKind::Authentication, what + " was rejected by the server");
}

/**
 * @brief Runs one credential against a connected, not yet authenticated session.
 */
struct Authenticator {
    ssh_session session;

    std::expected<void, StagingError> operator()(const AgentKey& agentKey) const {
        ssh_string blob = ssh_string_new(agentKey.blob.size());
        if (!blob) {
            return std::unexpected(makeError(ErrorKind::InvalidCredential, "Out of memory for agent key"));
        }
        ssh_string_fill(blob, agentKey.blob.data(), agentKey.blob.size());
        ssh_key raw = nullptr;
        int rc = ssh_pki_import_pubkey_blob(blob, &raw);
        ssh_string_free(blob);
        if (rc != SSH_OK) {
            return std::unexpected(makeError(ErrorKind::InvalidCredential, "Agent offered an unreadable public key"));
        }
        KeyHandle key(raw);

        // Ask whether the server would take this particular key, then let the
        // agent sign: keys the server refuses were already ruled out above.
        rc = ssh_userauth_try_publickey(session, nullptr, key.get());
        if (rc != SSH_AUTH_SUCCESS) {
            return std::unexpected(authError(session, rc, "Agent key"));
        }
        rc = ssh_userauth_agent(session, nullptr);
        if (rc != SSH_AUTH_SUCCESS) {
            return std::unexpected(authError(session, rc, "Agent signature"));
        }
        return {};
    }

    std::expected<void, StagingError> operator()(const PrivateKeyFile& keyFile) const {
        ssh_key raw = nullptr;
        int rc = ssh_pki_import_privkey_file(keyFile.path.c_str(), nullptr, nullptr, nullptr, &raw);
        if (rc == SSH_EOF) {
            return std::unexpected(makeError(ErrorKind::InvalidCredential, "Cannot read key file " + keyFile.path));
        }
        if (rc != SSH_OK) {
            // Probably encrypted: ask for the passphrase only now.
            if (keyFile.passphrase.empty()) {
                return std::unexpected(makeError(ErrorKind::InvalidCredential, "Key file needs a passphrase: " + keyFile.path));
            }
            auto passphrase = keyFile.passphrase.get();
            if (!passphrase) {
                return std::unexpected(passphrase.error());
            }
            rc = ssh_pki_import_privkey_file(keyFile.path.c_str(), passphrase->c_str(), nullptr, nullptr, &raw);
            if (rc != SSH_OK) {
                return std::unexpected(makeError(ErrorKind::InvalidCredential, "Wrong passphrase or unusable key file " + keyFile.path));
            }
        }
        KeyHandle key(raw);

        rc = ssh_userauth_publickey(session, nullptr, key.get());
        if (rc != SSH_AUTH_SUCCESS) {
            return std::unexpected(authError(session, rc, "Key file " + keyFile.path));
        }
        return {};
    }

    std::expected<void, StagingError> operator()(const PasswordCredential& password) const {
        auto secret = password.source.get();
        if (!secret) {
            return std::unexpected(secret.error());
        }
        int rc = ssh_userauth_password(session, nullptr, secret->c_str());
        if (rc != SSH_AUTH_SUCCESS) {
            return std::unexpected(authError(session, rc, "Password"));
        }
        return {};
    }
};

HostKeyStatus knownHostStatus(ssh_session session) {
    switch (ssh_session_is_known_server(session)) {
    case SSH_KNOWN_HOSTS_OK:
        return HostKeyStatus::Known;
    case SSH_KNOWN_HOSTS_UNKNOWN:
    case SSH_KNOWN_HOSTS_NOT_FOUND:
        return HostKeyStatus::Unknown;
    case SSH_KNOWN_HOSTS_CHANGED:
    case SSH_KNOWN_HOSTS_OTHER:
        return HostKeyStatus::Changed;
    case SSH_KNOWN_HOSTS_ERROR:
        break;
    }
    return HostKeyStatus::Error;
}

} // namespace

std::expected<std::unique_ptr<SftpTransport>, StagingError> SftpTransport::open(const StagingEndpoint& endpoint,
                                                                              const CredentialAttempt& credential,
                                                                              long timeoutSeconds) {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected(makeError(ErrorKind::Connection, "Failed to create SSH session"));
    }
    int port = endpoint.effectivePort();
    ssh_options_set(ssh, SSH_OPTIONS_HOST, endpoint.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeoutSeconds);
    if (!endpoint.user.empty()) {
        ssh_options_set(ssh, SSH_OPTIONS_USER, endpoint.user.c_str());
    }

    auto fail = [ssh](StagingError error) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(std::move(error));
    };

    if (ssh_connect(ssh) != SSH_OK) {
        return fail(makeError(ErrorKind::Connection, std::string("SSH connection failed: ") + ssh_get_error(ssh)));
    }
    if (auto known = checkHostKey(knownHostStatus(ssh), endpoint, ssh_get_error(ssh)); !known) {
        return fail(known.error());
    }
    if (auto authenticated = std::visit(Authenticator{ssh}, credential); !authenticated) {
        return fail(authenticated.error());
    }

    sftp_session sftp = sftp_new(ssh);
    if (!sftp) {
        return fail(makeError(ErrorKind::Protocol, std::string("SFTP initialization failed: ") + ssh_get_error(ssh)));
    }
    if (sftp_init(sftp) != SSH_OK) {
        sftp_free(sftp);
        return fail(makeError(ErrorKind::Protocol, std::string("SFTP initialization failed: ") + ssh_get_error(ssh)));
    }

    std::string start = "/";
    if (char* home = sftp_canonicalize_path(sftp, ".")) {
        start = home;
        ssh_string_free_char(home);
    }
    return std::make_unique<SftpTransport>(Passkey{}, endpoint, Location{fs::current_path(), joinRemotePath("/", start)},
                                           ssh, sftp);
}

SftpTransport::SftpTransport(Passkey, const StagingEndpoint& endpoint, Location start, ssh_session session, sftp_session sftp)
    : TransportClient(endpoint, std::move(start)), session_(session), sftp_(sftp) {}

SftpTransport::~SftpTransport() {
    close();
}

void SftpTransport::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
    }
}

StagingError SftpTransport::sftpError(const std::string& what, const std::string& path) const {
    int code = sftp_ ? sftp_get_error(sftp_) : SSH_FX_CONNECTION_LOST;
    ErrorKind kind = ErrorKind::Filesystem;
    if (code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH) {
        kind = ErrorKind::RemoteNotFound;
    } else if (code == SSH_FX_CONNECTION_LOST || code == SSH_FX_NO_CONNECTION || code == SSH_FX_BAD_MESSAGE) {
        kind = ErrorKind::Protocol;
    }
    StagingError error = makeError(kind, what + " failed: " + (session_ ? ssh_get_error(session_) : "not connected")
                                   + " (SFTP status " + std::to_string(code) + ")");
    error.url = url(path);
    return error;
}

std::optional<RemoteEntry> SftpTransport::statRemote(const std::string& path) {
    if (!sftp_) {
        return std::nullopt;
    }
    sftp_attributes attributes = sftp_stat(sftp_, path.c_str());
    if (!attributes) {
        return std::nullopt;
    }
    RemoteEntry entry;
    if (attributes->type == SSH_FILEXFER_TYPE_DIRECTORY) {
        entry.kind = EntryKind::Directory;
    } else if (attributes->type == SSH_FILEXFER_TYPE_REGULAR) {
        entry.kind = EntryKind::File;
        entry.size = attributes->size;
    }
    sftp_attributes_free(attributes);
    return entry;
}

std::expected<std::vector<std::string>, StagingError> SftpTransport::listRemote(const std::string& path) {
    sftp_dir dir = sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        return std::unexpected(sftpError("Listing", path));
    }

    std::vector<std::string> names;
    while (sftp_attributes attributes = sftp_readdir(sftp_, dir)) {
        std::string name = attributes->name ? attributes->name : "";
        sftp_attributes_free(attributes);
        if (name.empty() || name == "." || name == "..") {
            continue;
        }
        names.push_back(name);
    }
    bool complete = sftp_dir_eof(dir) != 0;
    sftp_closedir(dir);
    if (!complete) {
        return std::unexpected(sftpError("Listing", path));
    }
    return names;
}

std::expected<void, StagingError> SftpTransport::makeRemoteDirectory(const std::string& path) {
    if (sftp_mkdir(sftp_, path.c_str(), 0755) != SSH_OK) {
        return std::unexpected(sftpError("mkdir", path));
    }
    return {};
}

std::expected<void, StagingError> SftpTransport::removeRemoteDirectory(const std::string& path) {
    if (sftp_rmdir(sftp_, path.c_str()) != SSH_OK) {
        return std::unexpected(sftpError("rmdir", path));
    }
    return {};
}

std::expected<void, StagingError> SftpTransport::removeRemoteFile(const std::string& path) {
    if (sftp_unlink(sftp_, path.c_str()) != SSH_OK) {
        return std::unexpected(sftpError("unlink", path));
    }
    return {};
}

std::expected<void, StagingError> SftpTransport::retrieve(const std::string& remotePath, const fs::path& localPath) {
    sftp_file file = sftp_open(sftp_, remotePath.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(sftpError("open", remotePath));
    }
    std::ofstream output(localPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        sftp_close(file);
        return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to open local file: " + localPath.string()));
    }

    char buf[kBlockSize];
    while (true) {
        if (shutdownRequested()) {
            sftp_close(file);
            return std::unexpected(interrupted());
        }
        ssize_t n = sftp_read(file, buf, sizeof(buf));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            auto error = sftpError("read", remotePath);
            sftp_close(file);
            return std::unexpected(error);
        }
        output.write(buf, n);
        if (!output) {
            sftp_close(file);
            return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to write local file: " + localPath.string()));
        }
    }
    sftp_close(file);
    return {};
}

std::expected<void, StagingError> SftpTransport::store(const fs::path& localPath, const std::string& remotePath) {
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        return std::unexpected(makeError(ErrorKind::Filesystem, "Failed to open local file: " + localPath.string()));
    }
    sftp_file file = sftp_open(sftp_, remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!file) {
        return std::unexpected(sftpError("open", remotePath));
    }

    char buf[kBlockSize];
    while (input) {
        if (shutdownRequested()) {
            sftp_close(file);
            return std::unexpected(interrupted());
        }
        input.read(buf, sizeof(buf));
        std::streamsize count = input.gcount();
        if (count <= 0) {
            break;
        }
        if (sftp_write(file, buf, static_cast<size_t>(count)) != count) {
            auto error = sftpError("write", remotePath);
            sftp_close(file);
            return std::unexpected(error);
        }
    }
    if (sftp_close(file) != SSH_OK) {
        return std::unexpected(sftpError("close", remotePath));
    }
    return {};
}

std::expected<VolumeInfo, StagingError> SftpTransport::statVolume(const std::string& path) {
    if (!sftp_extension_supported(sftp_, "statvfs@openssh.com", "2")) {
        return TransportClient::statVolume(path);
    }
    sftp_statvfs_t stats = sftp_statvfs(sftp_, path.c_str());
    if (!stats) {
        return std::unexpected(sftpError("statvfs", path));
    }
    std::uintmax_t fragment = stats->f_frsize ? stats->f_frsize : stats->f_bsize;
    VolumeInfo volume;
    volume.blockSize = stats->f_bsize;
    volume.bytesOnDevice = stats->f_blocks * fragment;
    volume.unusedBytes = stats->f_bfree * fragment;
    volume.availableBytes = stats->f_bavail * fragment;
    volume.totalInodes = stats->f_files;
    volume.freeInodes = stats->f_ffree;
    sftp_statvfs_free(stats);
    return volume;
}
