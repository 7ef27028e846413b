#include "console.hpp"
#include "interrupt.hpp"
#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {

// Restores the terminal attributes it saved, on every exit path.
class EchoOff {
public:
    explicit EchoOff(int fd) : fd_(fd) {
        if (isatty(fd_) && tcgetattr(fd_, &saved_) == 0) {
            termios quiet = saved_;
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = tcsetattr(fd_, TCSAFLUSH, &quiet) == 0;
        }
    }
    ~EchoOff() {
        if (active_) {
            tcsetattr(fd_, TCSAFLUSH, &saved_);
        }
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

std::optional<std::string> Console::readLine(int fd) {
    std::string line;
    char c = 0;
    ssize_t n = 0;
    for (;;) {
        n = ::read(fd, &c, 1);
        if (n == 1) {
            if (c == '\n') {
                return line;
            }
            line += c;
            continue;
        }
        if (n < 0 && errno == EINTR && !shutdownRequested()) {
            continue;
        }
        break;
    }
    // Only redirected input may end its last line at end of file without a newline.
    if (n == 0 && !line.empty() && !isatty(fd)) {
        return line;
    }
    return std::nullopt;
}

std::optional<std::string> Console::ask(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<std::string> Console::askSecret(const std::string& prompt) {
    FileDescriptor tty(::open("/dev/tty", O_RDWR | O_NOCTTY));
    int fd = tty.get() >= 0 ? tty.get() : STDIN_FILENO;

    std::cerr << prompt << std::flush;
    std::optional<std::string> secret;
    {
        EchoOff echoOff(fd);
        secret = Console::readLine(fd);
    }
    std::cerr << std::endl;
    if (secret && !secret->empty() && secret->back() == '\r') {
        secret->pop_back();
    }
    return secret;
}
