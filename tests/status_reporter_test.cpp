#include "status_reporter.hpp"
#include <algorithm>
#include <sstream>
#include <gtest/gtest.h>

namespace {

TransferEvent notice(EventKind kind, const std::string& name, int level = 1, bool dryRun = false) {
    TransferEvent event;
    event.kind = kind;
    event.level = level;
    event.payload = name;
    event.dryRun = dryRun;
    return event;
}

Json::Value sampleSummary() {
    Json::Value summary(Json::objectValue);
    summary["Staged To"] = "sftp://bob@host/Lockss/au1";
    summary["Dry Run"] = false;
    summary["Files Uploaded"] = 3;
    return summary;
}

} // namespace

TEST(StatusReporterTest, NoticeLinesCarryTheirMarkers) {
    EXPECT_EQ(StatusReporter::formatNotice(notice(EventKind::Uploaded, "page.html")), ">>> page.html");
    EXPECT_EQ(StatusReporter::formatNotice(notice(EventKind::Downloaded, "page.html")), "<<< page.html");
    EXPECT_EQ(StatusReporter::formatNotice(notice(EventKind::Excluded, "Thumbs.db")), "--- excluded Thumbs.db");
    EXPECT_EQ(StatusReporter::formatNotice(notice(EventKind::Removed, "old")), "xxx rm old");
    EXPECT_EQ(StatusReporter::formatNotice(notice(EventKind::Uploaded, "x", 1, true)), "(dry-run) >>> x");

    TransferEvent chdir = notice(EventKind::Chdir, "");
    chdir.payload = Json::Value(Json::arrayValue);
    chdir.payload.append("/home/bob/au1");
    chdir.payload.append("/Lockss/au1");
    EXPECT_EQ(StatusReporter::formatNotice(chdir), "... cd /Lockss/au1");
}

TEST(StatusReporterTest, VerbosityGatesNotices) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter reporter(kMimeText, 1, out, err);

    reporter(notice(EventKind::Uploaded, "a.txt", 1));
    reporter(notice(EventKind::Chdir, "/Lockss", 2));
    EXPECT_EQ(out.str(), ">>> a.txt\n");
    EXPECT_TRUE(err.str().empty());
}

TEST(StatusReporterTest, QuietStillPrintsTheResult) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter reporter(kMimeText, 0, out, err);

    reporter(notice(EventKind::Uploaded, "a.txt"));
    TransferEvent ok;
    ok.level = 0;
    ok.kind = EventKind::Ok;
    ok.payload = sampleSummary();
    reporter(ok);

    EXPECT_EQ(out.str().rfind("JSON PACKET: {", 0), 0u);
    EXPECT_EQ(out.str().find(">>>"), std::string::npos);
}

TEST(StatusReporterTest, MachineOutputMovesNoticesToStderr) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter reporter(kMimeJson, 1, out, err);

    reporter(notice(EventKind::Downloaded, "a.txt"));
    TransferEvent ok;
    ok.kind = EventKind::Ok;
    ok.level = 0;
    ok.payload = sampleSummary();
    reporter(ok);

    EXPECT_EQ(err.str(), "<<< a.txt\n");
    Json::Value parsed;
    Json::Reader reader;
    ASSERT_TRUE(reader.parse(out.str(), parsed));
    EXPECT_EQ(parsed["Staged To"].asString(), "sftp://bob@host/Lockss/au1");
    std::string written = out.str();
    EXPECT_EQ(std::count(written.begin(), written.end(), '\n'), 1);
}

TEST(StatusReporterTest, TabSeparatedResultWritesOneKeyPerLine) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter reporter(kMimeTsv, 1, out, err);

    EXPECT_EQ(reporter.formatResult(sampleSummary()),
              "Dry Run\tfalse\nFiles Uploaded\t3\nStaged To\tsftp://bob@host/Lockss/au1\n");
}

TEST(StatusReporterTest, SupportedOutputs) {
    EXPECT_TRUE(isSupportedOutput("text/plain"));
    EXPECT_TRUE(isSupportedOutput("application/json"));
    EXPECT_TRUE(isSupportedOutput("text/tab-separated-values"));
    EXPECT_FALSE(isSupportedOutput("text/html"));
}
