#include "authentication_resolver.hpp"
#include "interrupt.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

StagingEndpoint sftpEndpoint(const std::string& identity) {
    StagingEndpoint endpoint;
    endpoint.protocol = Protocol::Sftp;
    endpoint.host = "staging.example.org";
    endpoint.user = "bob";
    endpoint.password = "P";
    endpoint.identity = identity;
    return endpoint;
}

std::shared_ptr<KeyAgent> twoKeyAgent() {
    return std::make_shared<FakeAgent>(std::vector<AgentKey>{{"blob-1", "A1"}, {"blob-2", "A2"}});
}

SecretSource::Prompt noAnswer() {
    return []() { return std::optional<std::string>(); };
}

} // namespace

TEST(AuthenticationResolverTest, TriesAgentKeysThenKeyFileAndStopsAtFirstSuccess) {
    TempDir home;
    std::string keyPath = (home / "K").string();
    AuthenticationResolver resolver(sftpEndpoint(keyPath), twoKeyAgent(), noAnswer(), noAnswer(), home.path());
    FakeConnector connector(
        [](const CredentialAttempt& attempt) { return std::holds_alternative<PrivateKeyFile>(attempt); },
        home.path());

    auto session = resolver.openConnection(connector);
    ASSERT_TRUE(session.has_value());

    std::vector<std::string> expected = {"agent key (A1)", "agent key (A2)", "keyfile " + keyPath};
    EXPECT_EQ(connector.tried, expected);
    EXPECT_EQ(session->authenticatedWith(), "keyfile " + keyPath);
}

TEST(AuthenticationResolverTest, AggregatesEveryFailedAttempt) {
    TempDir home;
    std::string keyPath = (home / "K").string();
    AuthenticationResolver resolver(sftpEndpoint(keyPath), twoKeyAgent(), noAnswer(), noAnswer(), home.path());
    FakeConnector connector(acceptNothing(), home.path());

    auto session = resolver.openConnection(connector);
    ASSERT_FALSE(session.has_value());

    const StagingError& error = session.error();
    EXPECT_EQ(error.kind, ErrorKind::Connection);
    ASSERT_EQ(error.attempts.size(), 4u);
    EXPECT_EQ(error.attempts[0].attempt, "agent key (A1)");
    EXPECT_EQ(error.attempts[1].attempt, "agent key (A2)");
    EXPECT_EQ(error.attempts[2].attempt, "keyfile " + keyPath);
    EXPECT_EQ(error.attempts[3].attempt, "password");
    for (const auto& failure : error.attempts) {
        EXPECT_EQ(failure.cause, "rejected " + failure.attempt);
    }
    EXPECT_EQ(exitCodeFor(error), 1);
    EXPECT_NE(error.describe().find("agent key (A1): rejected"), std::string::npos);
}

TEST(AuthenticationResolverTest, FtpOffersPasswordOnly) {
    TempDir home;
    StagingEndpoint endpoint = sftpEndpoint((home / "K").string());
    endpoint.protocol = Protocol::Ftp;
    AuthenticationResolver resolver(endpoint, twoKeyAgent(), noAnswer(), noAnswer(), home.path());

    auto attempts = resolver.buildAttempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PasswordCredential>(attempts.front()));
}

TEST(AuthenticationResolverTest, AuthenticationModeNarrowsTheList) {
    TempDir home;
    StagingEndpoint endpoint = sftpEndpoint((home / "K").string());

    endpoint.authentication = AuthMode::Agent;
    EXPECT_EQ(AuthenticationResolver(endpoint, twoKeyAgent(), noAnswer(), noAnswer(), home.path()).buildAttempts().size(), 2u);

    endpoint.authentication = AuthMode::KeyFile;
    auto keyOnly = AuthenticationResolver(endpoint, twoKeyAgent(), noAnswer(), noAnswer(), home.path()).buildAttempts();
    ASSERT_EQ(keyOnly.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PrivateKeyFile>(keyOnly.front()));

    endpoint.authentication = AuthMode::Password;
    auto passwordOnly = AuthenticationResolver(endpoint, twoKeyAgent(), noAnswer(), noAnswer(), home.path()).buildAttempts();
    ASSERT_EQ(passwordOnly.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PasswordCredential>(passwordOnly.front()));
}

TEST(AuthenticationResolverTest, MissingIdentityFileIsLeftOut) {
    TempDir home;
    StagingEndpoint endpoint = sftpEndpoint("");
    endpoint.identity.reset();
    AuthenticationResolver resolver(endpoint, std::make_shared<FakeAgent>(std::vector<AgentKey>{}), noAnswer(), noAnswer(), home.path());

    auto attempts = resolver.buildAttempts();
    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(describeAttempt(attempts.front()), "password");
}

TEST(AuthenticationResolverTest, PasswordIsPromptedOnlyWhenNeeded) {
    TempDir home;
    StagingEndpoint endpoint = sftpEndpoint("");
    endpoint.identity.reset();
    endpoint.password.reset();
    int asked = 0;
    AuthenticationResolver resolver(endpoint, nullptr,
                                    [&asked]() { ++asked; return std::optional<std::string>("typed"); },
                                    noAnswer(), home.path());
    FakeConnector connector(acceptPassword("typed"), home.path());

    auto session = resolver.openConnection(connector);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(asked, 1);
    EXPECT_EQ(connector.tried, std::vector<std::string>{"password (prompt)"});
}

TEST(AuthenticationResolverTest, UnreachableHostStopsTheCascade) {
    TempDir home;
    AuthenticationResolver resolver(sftpEndpoint((home / "K").string()), twoKeyAgent(), noAnswer(), noAnswer(), home.path());
    FakeConnector connector(acceptNothing(), home.path());
    connector.failure = makeError(ErrorKind::Connection, "Connection refused");

    auto session = resolver.openConnection(connector);
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().kind, ErrorKind::Connection);
    EXPECT_EQ(connector.tried.size(), 1u);
    ASSERT_EQ(session.error().attempts.size(), 1u);
    EXPECT_EQ(session.error().attempts[0].cause, "Connection refused");
}

TEST(AuthenticationResolverTest, InterruptDuringTheLastAttemptIsNotALoginFailure) {
    TempDir home;
    StagingEndpoint endpoint = sftpEndpoint((home / "K").string());
    endpoint.password.reset();
    AuthenticationResolver resolver(endpoint, twoKeyAgent(),
                                    []() { gShutdownFlag = 1; return std::optional<std::string>(); },
                                    noAnswer(), home.path());
    FakeConnector connector(acceptPassword("P"), home.path());

    auto session = resolver.openConnection(connector);
    gShutdownFlag = 0;
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().kind, ErrorKind::Interrupted);
    EXPECT_EQ(connector.tried.size(), 4u);
}

TEST(SecretSourceTest, PromptsOnceAndRemembers) {
    int asked = 0;
    SecretSource source = SecretSource::prompted([&asked]() { ++asked; return std::optional<std::string>("s3cret"); });
    EXPECT_TRUE(source.isInteractive());
    ASSERT_TRUE(source.get().has_value());
    ASSERT_TRUE(source.get().has_value());
    EXPECT_EQ(*source.get(), "s3cret");
    EXPECT_EQ(asked, 1);
}

TEST(SecretSourceTest, UnansweredPromptIsAnInvalidCredential) {
    SecretSource source = SecretSource::prompted([]() { return std::optional<std::string>(); });
    auto secret = source.get();
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error().kind, ErrorKind::InvalidCredential);
}
