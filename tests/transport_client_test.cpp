#include "transfer_session.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(JoinRemotePathTest, NormalizesSegments) {
    EXPECT_EQ(joinRemotePath("/Lockss", "au"), "/Lockss/au");
    EXPECT_EQ(joinRemotePath("/Lockss/au", ".."), "/Lockss");
    EXPECT_EQ(joinRemotePath("/Lockss", "./au/"), "/Lockss/au");
    EXPECT_EQ(joinRemotePath("/Lockss", "/other"), "/other");
    EXPECT_EQ(joinRemotePath("/", ".."), "/");
    EXPECT_EQ(joinRemotePath("/Lockss", "."), "/Lockss");
}

TEST(TransportClientTest, MissingRemoteDirectoryReportsUrl) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    FakeTransport transport(local.path(), remote);

    auto entered = transport.setRemoteLocation("Lockss", false);
    ASSERT_FALSE(entered.has_value());
    EXPECT_EQ(entered.error().kind, ErrorKind::RemoteNotFound);
    EXPECT_EQ(entered.error().url, "sftp://bob@staging.example.org/Lockss");
    EXPECT_EQ(exitCodeFor(entered.error()), 3);
    EXPECT_EQ(transport.getLocation().remote, "/");
}

TEST(TransportClientTest, MakeCreatesAndEntersRemoteDirectory) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    FakeTransport transport(local.path(), remote);

    auto previous = transport.setRemoteLocation("Lockss", true);
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, "/");
    EXPECT_EQ(transport.getLocation().remote, "/Lockss");
    EXPECT_TRUE(remote->hasDirectory("/Lockss"));
    EXPECT_EQ(remote->counters.mkdir, 1);
}

TEST(TransportClientTest, NewDirectoryItemCreatesBesideTheCurrentLocation) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    remote->addDirectory("/Lockss");
    FakeTransport transport(local.path(), remote);
    ASSERT_TRUE(transport.setRemoteLocation("/Lockss", false).has_value());

    ASSERT_TRUE(transport.newDirectoryItem("au1").has_value());
    EXPECT_TRUE(remote->hasDirectory("/Lockss/au1"));
    EXPECT_EQ(transport.getLocation().remote, "/Lockss");
    EXPECT_EQ(remote->counters.mkdir, 1);

    auto orphan = transport.newDirectoryItem("missing/au2");
    ASSERT_FALSE(orphan.has_value());
    EXPECT_EQ(orphan.error().kind, ErrorKind::Filesystem);
}

TEST(TransportClientTest, NewDirectoryItemDoesNothingInDryRun) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    FakeTransport transport(local.path(), remote);
    transport.setDryRun(true);

    ASSERT_TRUE(transport.newDirectoryItem("au1").has_value());
    EXPECT_FALSE(remote->hasDirectory("/au1"));
    EXPECT_EQ(remote->counters.total(), 0);
}

TEST(TransportClientTest, EnteringAFileFailsInDryRunToo) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    remote->addFile("/Lockss/au1", "not a directory");

    for (bool dryRun : {false, true}) {
        FakeTransport transport(local.path(), remote);
        transport.setDryRun(dryRun);
        auto entered = transport.setRemoteLocation("/Lockss/au1", true);
        ASSERT_FALSE(entered.has_value()) << "dry run " << dryRun;
        EXPECT_EQ(entered.error().kind, ErrorKind::Filesystem);
        EXPECT_EQ(transport.getLocation().remote, "/");
    }
    EXPECT_EQ(remote->counters.mkdir, 0);
}

TEST(TransportClientTest, DryRunPretendsToCreateDirectories) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    FakeTransport transport(local.path(), remote);
    transport.setDryRun(true);

    ASSERT_TRUE(transport.setRemoteLocation("phantom", true).has_value());
    ASSERT_TRUE(transport.setLocalLocation("phantom", true).has_value());
    EXPECT_EQ(transport.getLocation().remote, "/phantom");
    EXPECT_FALSE(remote->hasDirectory("/phantom"));
    EXPECT_FALSE(fs::exists(local / "phantom"));

    auto children = transport.getChildItem();
    ASSERT_TRUE(children.has_value());
    EXPECT_TRUE(children->empty());
    EXPECT_EQ(remote->counters.total(), 0);
}

TEST(TransportClientTest, FileQueries) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    FakeTransport transport(local.path(), remote);
    remote->addFile("/au/page.html", "12345");

    ASSERT_TRUE(transport.setRemoteLocation("/au", false).has_value());
    EXPECT_EQ(transport.getFileSize("page.html"), std::optional<std::uintmax_t>(5));
    EXPECT_FALSE(transport.getFileSize("missing").has_value());
    EXPECT_FALSE(transport.isDirectory("page.html"));
    ASSERT_TRUE(transport.setRemoteLocation("..", false).has_value());
    EXPECT_TRUE(transport.isDirectory("au"));
    EXPECT_FALSE(transport.probe("nothing").has_value());
}

TEST(TransportClientTest, FreeSpaceIsUnsupportedByDefault) {
    TempDir local;
    FakeTransport transport(local.path(), std::make_shared<FakeRemote>(), Protocol::Ftp);
    auto volume = transport.getVolume(".");
    ASSERT_FALSE(volume.has_value());
    EXPECT_EQ(volume.error().kind, ErrorKind::Unsupported);
}

TEST(TransferSessionTest, LocalFailureRestoresRemoteSide) {
    TempDir local;
    auto remote = std::make_shared<FakeRemote>();
    remote->addDirectory("/au");
    TransferSession session(std::make_unique<FakeTransport>(local.path(), remote), "password");
    Location before = session.location();

    auto moved = session.setLocation("does-not-exist", "/au", false);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind, ErrorKind::Filesystem);
    EXPECT_EQ(session.location(), before);
}

TEST(TransferSessionTest, GuardRestoresOnScopeExit) {
    TempDir local;
    fs::create_directories(local / "sub");
    auto remote = std::make_shared<FakeRemote>();
    remote->addDirectory("/au");
    Location before;
    {
        TransferSession session(std::make_unique<FakeTransport>(local.path(), remote), "password");
        before = session.location();
        {
            LocationGuard guard(session);
            ASSERT_TRUE(session.setLocation("sub", "/au", false).has_value());
            EXPECT_EQ(session.location().remote, "/au");
            EXPECT_EQ(session.location().local, local.path() / "sub");
        }
        EXPECT_EQ(session.location(), before);
        EXPECT_EQ(remote->closeCount, 0);
    }
    EXPECT_EQ(remote->closeCount, 1);
}
