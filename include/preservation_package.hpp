/**
 * @file preservation_package.hpp
 * @brief Local checks on a preservation package before it is staged.
 *
 * A package is a local directory holding one Archival Unit. Staging requires
 * a BagIt enclosure and a LOCKSS manifest page that grants the crawler
 * permission to collect the content.
 */

#ifndef PRESERVATION_PACKAGE_HPP
#define PRESERVATION_PACKAGE_HPP

#include <filesystem>
#include <string>
#include <json/json.h>

/**
 * @brief Package checks consumed by the staging orchestrator.
 */
class PackageInspector {
public:
    virtual ~PackageInspector() = default;

    /**
     * @brief True when the package has a data/ directory and a bagit.txt declaration.
     */
    virtual bool hasBagitEnclosure() const = 0;

    /**
     * @brief True when the manifest page exists and carries the LOCKSS permission statement.
     */
    virtual bool hasValidManifest() const = 0;

    /**
     * @brief Recomputes the size of the package tree.
     *
     * @return A string such as "2.1 GiB (2,243,154,758 bytes, 689 files)".
     */
    virtual std::string resetFileSize() = 0;

    /**
     * @brief Metadata to pass on to the next pipeline stage ("Ingest Title", "File Size", ...).
     */
    virtual Json::Value getPipelineMetadata() const = 0;
};

/**
 * @brief PackageInspector over a directory on the local filesystem.
 */
class PreservationPackage : public PackageInspector {
public:
    static constexpr const char* kManifestFile = "manifest.html";
    static constexpr const char* kPermissionStatement =
        "LOCKSS system has permission to collect, preserve, and serve this Archival Unit";

    /**
     * @param root Package directory.
     * @param metadata Known details of the package, typically the merged pipeline input.
     */
    PreservationPackage(std::filesystem::path root, Json::Value metadata = Json::Value(Json::objectValue));

    bool hasBagitEnclosure() const override;
    bool hasValidManifest() const override;
    std::string resetFileSize() override;
    Json::Value getPipelineMetadata() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    Json::Value metadata_;
    std::string fileSize_;
};

#endif // PRESERVATION_PACKAGE_HPP
