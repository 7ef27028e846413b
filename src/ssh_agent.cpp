#include "ssh_agent.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr unsigned char kRequestIdentities = 11;
constexpr unsigned char kIdentitiesAnswer = 12;
constexpr std::uint32_t kMaxReply = 256 * 1024;

std::uint32_t readUint32(const std::string& data, size_t offset) {
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

bool readString(const std::string& data, size_t& offset, std::string& out) {
    if (offset + 4 > data.size()) {
        return false;
    }
    std::uint32_t length = readUint32(data, offset);
    offset += 4;
    if (length > data.size() - offset) {
        return false;
    }
    out = data.substr(offset, length);
    offset += length;
    return true;
}

bool readExactly(int fd, char* buffer, size_t length) {
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::read(fd, buffer + done, length - done);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool writeAll(int fd, const char* buffer, size_t length) {
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::write(fd, buffer + done, length - done);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

SshAgentClient::SshAgentClient(std::string socketPath) : socketPath_(std::move(socketPath)) {
    if (socketPath_.empty()) {
        if (const char* env = std::getenv("SSH_AUTH_SOCK")) {
            socketPath_ = env;
        }
    }
}

std::vector<AgentKey> SshAgentClient::listIdentities() {
    if (socketPath_.empty()) {
        return {};
    }

    sockaddr_un address{};
    address.sun_family = AF_UNIX;
    if (socketPath_.size() >= sizeof(address.sun_path)) {
        return {};
    }
    std::memcpy(address.sun_path, socketPath_.c_str(), socketPath_.size() + 1);

    SocketHandle sock(::socket(AF_UNIX, SOCK_STREAM, 0));
    if (sock.get() < 0) {
        return {};
    }
    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        return {};
    }

    const char request[5] = {0, 0, 0, 1, static_cast<char>(kRequestIdentities)};
    if (!writeAll(sock.get(), request, sizeof(request))) {
        return {};
    }

    char header[4];
    if (!readExactly(sock.get(), header, sizeof(header))) {
        return {};
    }
    std::uint32_t length = readUint32(std::string(header, sizeof(header)), 0);
    if (length == 0 || length > kMaxReply) {
        return {};
    }
    std::string reply(length, '\0');
    if (!readExactly(sock.get(), reply.data(), length)) {
        return {};
    }
    return parseIdentitiesAnswer(reply);
}

std::vector<AgentKey> SshAgentClient::parseIdentitiesAnswer(const std::string& reply) {
    if (reply.size() < 5 || static_cast<unsigned char>(reply[0]) != kIdentitiesAnswer) {
        return {};
    }
    std::uint32_t count = readUint32(reply, 1);
    size_t offset = 5;

    std::vector<AgentKey> keys;
    for (std::uint32_t i = 0; i < count; ++i) {
        AgentKey key;
        if (!readString(reply, offset, key.blob) || !readString(reply, offset, key.comment)) {
            return {};
        }
        keys.push_back(std::move(key));
    }
    return keys;
}
