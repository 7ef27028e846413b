#include "console.hpp"
#include "interrupt.hpp"
#include <csignal>
#include <string>
#include <sys/time.h>
#include <unistd.h>
#include <gtest/gtest.h>

namespace {

// Pipe holding @p input. Unless kept open, the write end is closed so reads end at EOF.
class InputPipe {
public:
    explicit InputPipe(const std::string& input, bool keepOpen = false) {
        if (::pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
            return;
        }
        ssize_t written = ::write(fds_[1], input.data(), input.size());
        (void)written;
        if (!keepOpen) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }
    ~InputPipe() {
        for (int fd : fds_) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }
    int readEnd() const { return fds_[0]; }

private:
    int fds_[2] = {-1, -1};
};

void raiseShutdown(int /*sig*/) {
    gShutdownFlag = 1;
}

} // namespace

TEST(ConsoleTest, ReadsLinesOneAtATime) {
    InputPipe input("s3cret\nnext\n");
    ASSERT_GE(input.readEnd(), 0);
    EXPECT_EQ(Console::readLine(input.readEnd()), std::optional<std::string>("s3cret"));
    EXPECT_EQ(Console::readLine(input.readEnd()), std::optional<std::string>("next"));
    EXPECT_FALSE(Console::readLine(input.readEnd()).has_value());
}

TEST(ConsoleTest, EmptyLineIsAnAnswer) {
    InputPipe input("\n");
    EXPECT_EQ(Console::readLine(input.readEnd()), std::optional<std::string>(""));
}

TEST(ConsoleTest, RedirectedInputMayOmitTheFinalNewline) {
    InputPipe input("last");
    EXPECT_EQ(Console::readLine(input.readEnd()), std::optional<std::string>("last"));
}

TEST(ConsoleTest, FailedReadGivesNothing) {
    EXPECT_FALSE(Console::readLine(-1).has_value());
}

TEST(ConsoleTest, InterruptMidLineGivesNoPartialSecret) {
    InputPipe input("sec", true);
    struct sigaction action {};
    action.sa_handler = raiseShutdown;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    struct sigaction previous {};
    ASSERT_EQ(sigaction(SIGALRM, &action, &previous), 0);

    itimerval timer {};
    timer.it_value.tv_usec = 100000;
    setitimer(ITIMER_REAL, &timer, nullptr);
    auto line = Console::readLine(input.readEnd());

    sigaction(SIGALRM, &previous, nullptr);
    bool interruptedRead = gShutdownFlag != 0;
    gShutdownFlag = 0;
    EXPECT_TRUE(interruptedRead);
    EXPECT_FALSE(line.has_value());
}
