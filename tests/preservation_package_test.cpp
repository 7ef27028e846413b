#include "plugin_metadata.hpp"
#include "preservation_package.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(PreservationPackageTest, BagitEnclosureNeedsDataAndDeclaration) {
    TempDir root;
    PreservationPackage package(root.path());
    EXPECT_FALSE(package.hasBagitEnclosure());

    writeFile(root.path() / "data" / "scan.tif", "tif");
    EXPECT_FALSE(package.hasBagitEnclosure());

    writeFile(root / "bagit.txt", "BagIt-Version: 0.97\n");
    EXPECT_TRUE(package.hasBagitEnclosure());
}

TEST(PreservationPackageTest, ManifestStatementMayBeWrapped) {
    TempDir root;
    PreservationPackage package(root.path());
    EXPECT_FALSE(package.hasValidManifest());

    writeFile(root / "manifest.html", "<p>LOCKSS system has permission to collect,\n\t preserve, and serve\n"
                                      "this Archival Unit.</p>");
    EXPECT_TRUE(package.hasValidManifest());

    writeFile(root / "manifest.html", "<p>Please do not collect this Archival Unit.</p>");
    EXPECT_FALSE(package.hasValidManifest());
}

TEST(PreservationPackageTest, FileSizeCountsEveryEntry) {
    TempDir root;
    writeFile(root.path() / "data" / "a.bin", std::string(2047, 'x'));
    writeFile(root / "bagit.txt", "1");
    PreservationPackage package(root.path());

    EXPECT_EQ(package.resetFileSize(), "2.0 KiB (2,048 bytes, 3 files)");
    EXPECT_EQ(package.getPipelineMetadata()["File Size"].asString(), "2.0 KiB (2,048 bytes, 3 files)");
}

TEST(PreservationPackageTest, SingularUnits) {
    TempDir root;
    writeFile(root / "one.txt", "1");
    PreservationPackage package(root.path());
    EXPECT_EQ(package.resetFileSize(), "1.0 B (1 byte, 1 file)");
}

TEST(PreservationPackageTest, PipelineMetadataFallsBackToAuTitle) {
    TempDir root;
    Json::Value known;
    known["au_title"] = "WPA Folder 01";
    PreservationPackage package(root.path(), known);

    Json::Value metadata = package.getPipelineMetadata();
    EXPECT_EQ(metadata["Ingest Title"].asString(), "WPA Folder 01");
    EXPECT_EQ(metadata["Packaged In"].asString(), fs::weakly_canonical(root.path()).string());
    EXPECT_FALSE(metadata.isMember("File Size"));
}

TEST(PipelinePluginMetadataTest, ReadsDetailsAndParameters) {
    Json::Value pipeline;
    pipeline["Plugin ID"] = "gov.alabama.archives.WPAPlugin";
    pipeline["Plugin Name"] = "WPA Folders";
    pipeline["Plugin Version"] = 3;
    pipeline["parameters"] = Json::Value(Json::arrayValue);
    Json::Value pair(Json::arrayValue);
    pair.append("base_url");
    pair.append("http://example.org/");
    pipeline["parameters"].append(pair);

    PipelinePluginMetadata plugin(pipeline);
    auto details = plugin.getDetails();
    ASSERT_EQ(details.size(), 3u);
    EXPECT_EQ(details[0].first, "Plugin ID");
    EXPECT_EQ(details[2].second, "3");
    EXPECT_EQ(plugin.getParameterKeys(), std::vector<std::string>{"base_url"});
}

TEST(PipelinePluginMetadataTest, EmptyPipelineHasNothing) {
    PipelinePluginMetadata plugin(Json::Value(Json::objectValue));
    EXPECT_TRUE(plugin.getDetails().empty());
    EXPECT_TRUE(plugin.parameters().isArray());
    EXPECT_TRUE(plugin.getParameterKeys().empty());
}
