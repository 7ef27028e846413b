#include "preservation_package.hpp"
#include "byte_size.hpp"
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

PreservationPackage::PreservationPackage(fs::path root, Json::Value metadata)
    : root_(std::move(root)), metadata_(std::move(metadata)) {}

bool PreservationPackage::hasBagitEnclosure() const {
    std::error_code ec;
    return fs::is_directory(root_ / "data", ec) && fs::is_regular_file(root_ / "bagit.txt", ec);
}

bool PreservationPackage::hasValidManifest() const {
    fs::path manifest = root_ / kManifestFile;
    std::error_code ec;
    if (!fs::is_regular_file(manifest, ec)) {
        return false;
    }
    std::ifstream file(manifest);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream html;
    html << file.rdbuf();

    // The statement may be wrapped or reflowed, so any run of whitespace separates words.
    std::string pattern;
    std::istringstream words(kPermissionStatement);
    std::string word;
    while (words >> word) {
        if (!pattern.empty()) {
            pattern += "\\s+";
        }
        pattern += word;
    }
    return std::regex_search(html.str(), std::regex(pattern));
}

std::string PreservationPackage::resetFileSize() {
    std::uintmax_t bytes = 0;
    std::uintmax_t files = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        ++files;
        if (it->is_regular_file(ec)) {
            std::uintmax_t size = it->file_size(ec);
            if (!ec) {
                bytes += size;
            }
        }
        ec.clear();
    }

    fileSize_ = humanBytesIec(bytes) + " (" + groupThousands(bytes) + (bytes == 1 ? " byte, " : " bytes, ") +
                groupThousands(files) + (files == 1 ? " file)" : " files)");
    return fileSize_;
}

Json::Value PreservationPackage::getPipelineMetadata() const {
    Json::Value metadata(Json::objectValue);
    if (metadata_.isMember("Ingest Title")) {
        metadata["Ingest Title"] = metadata_["Ingest Title"];
    } else if (metadata_.isMember("au_title")) {
        metadata["Ingest Title"] = metadata_["au_title"];
    }
    if (!fileSize_.empty()) {
        metadata["File Size"] = fileSize_;
    } else if (metadata_.isMember("File Size")) {
        metadata["File Size"] = metadata_["File Size"];
    }
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root_, ec);
    metadata["Packaged In"] = (ec ? root_ : canonical).string();
    return metadata;
}
