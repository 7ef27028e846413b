#include "byte_size.hpp"
#include "ssh_agent.hpp"
#include "staging_error.hpp"
#include <cstdint>
#include <gtest/gtest.h>

namespace {

void appendUint32(std::string& out, std::uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xff));
    out.push_back(static_cast<char>((value >> 16) & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    out.push_back(static_cast<char>(value & 0xff));
}

void appendString(std::string& out, const std::string& value) {
    appendUint32(out, static_cast<std::uint32_t>(value.size()));
    out += value;
}

} // namespace

TEST(StagingErrorTest, ExitCodes) {
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Connection, "x")), 1);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Authentication, "x")), 1);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::InvalidCredential, "x")), 1);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Precondition, "x")), 2);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Protocol, "x")), 3);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Filesystem, "x")), 3);
    EXPECT_EQ(exitCodeFor(makeError(ErrorKind::Unsupported, "x")), 3);
    EXPECT_EQ(exitCodeFor(interrupted()), 255);
}

TEST(StagingErrorTest, DescribeIncludesUrlAndRemedy) {
    StagingError error = remoteNotFound("/Lockss/au1", "sftp://bob@host/Lockss/au1");
    EXPECT_EQ(error.describe(), "Not found: Remote location not found: /Lockss/au1 (sftp://bob@host/Lockss/au1)");

    StagingError precondition = makeError(ErrorKind::Precondition, "No bag");
    precondition.remedy = "Bag it.";
    EXPECT_EQ(precondition.describe(), "Precondition failed: No bag\n  Bag it.");
}

TEST(ByteSizeTest, Formats) {
    EXPECT_EQ(groupThousands(0), "0");
    EXPECT_EQ(groupThousands(999), "999");
    EXPECT_EQ(groupThousands(1000), "1,000");
    EXPECT_EQ(groupThousands(2243154758u), "2,243,154,758");
    EXPECT_EQ(humanBytes(512), "512.0 B");
    EXPECT_EQ(humanBytes(1536), "1.5 KB");
    EXPECT_EQ(humanBytesIec(1048576), "1.0 MiB");
}

TEST(SshAgentTest, ParsesIdentitiesAnswer) {
    std::string reply(1, static_cast<char>(12));
    appendUint32(reply, 2);
    appendString(reply, "blob-1");
    appendString(reply, "bob@laptop");
    appendString(reply, "blob-2");
    appendString(reply, "backup key");

    auto keys = SshAgentClient::parseIdentitiesAnswer(reply);
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0].blob, "blob-1");
    EXPECT_EQ(keys[0].comment, "bob@laptop");
    EXPECT_EQ(keys[1].comment, "backup key");
}

TEST(SshAgentTest, MalformedAnswerHoldsNoKeys) {
    std::string reply(1, static_cast<char>(12));
    appendUint32(reply, 1);
    appendString(reply, "blob-1");
    appendUint32(reply, 40);
    reply += "short";
    EXPECT_TRUE(SshAgentClient::parseIdentitiesAnswer(reply).empty());

    std::string failure(1, static_cast<char>(5));
    EXPECT_TRUE(SshAgentClient::parseIdentitiesAnswer(failure).empty());

    SshAgentClient unreachable("/nonexistent/agent.sock");
    EXPECT_TRUE(unreachable.listIdentities().empty());
}
