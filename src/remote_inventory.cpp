#include "remote_inventory.hpp"
#include "byte_size.hpp"
#include "interrupt.hpp"
#include "status_reporter.hpp"

std::expected<std::vector<InventoryEntry>, StagingError> RemoteInventory::list(const std::string& path,
                                                                               std::optional<int> maxDepth) {
    std::vector<InventoryEntry> entries;
    if (maxDepth && *maxDepth <= 0) {
        return entries;
    }

    LocationGuard guard(session_);
    auto entered = session_.transport().setRemoteLocation(path, false);
    if (!entered) {
        return std::unexpected(entered.error());
    }
    auto walked = walk("", maxDepth, entries);
    if (!walked) {
        return std::unexpected(walked.error());
    }
    return entries;
}

std::expected<void, StagingError> RemoteInventory::walk(const std::string& prefix,
                                                        std::optional<int> depth,
                                                        std::vector<InventoryEntry>& entries) {
    TransportClient& transport = session_.transport();
    auto children = transport.getChildItem();
    if (!children) {
        return std::unexpected(children.error());
    }

    for (const auto& child : *children) {
        if (shutdownRequested()) {
            return std::unexpected(interrupted());
        }
        std::string relative = prefix.empty() ? child : prefix + "/" + child;
        auto kind = transport.probe(child);
        if (kind == EntryKind::File) {
            entries.push_back({relative, transport.getFileSize(child).value_or(0)});
            continue;
        }
        if (kind != EntryKind::Directory) {
            continue;
        }

        std::optional<int> remaining = depth ? std::optional<int>(*depth - 1) : std::nullopt;
        if (remaining && *remaining <= 0) {
            continue;
        }
        LocationGuard guard(session_);
        auto entered = transport.setRemoteLocation(child, false);
        if (!entered) {
            return std::unexpected(entered.error());
        }
        auto walked = walk(relative, remaining, entries);
        if (!walked) {
            return walked;
        }
    }
    return {};
}

std::uintmax_t RemoteInventory::totalBytes(const std::vector<InventoryEntry>& entries) {
    std::uintmax_t total = 0;
    for (const auto& entry : entries) {
        total += entry.size;
    }
    return total;
}

std::string RemoteInventory::formatTotal(std::uintmax_t bytes, std::uintmax_t files, const std::string& mimeType) {
    if (mimeType == kMimeTsv) {
        return humanBytes(bytes) + "\t" + groupThousands(bytes) + "\t" + groupThousands(files);
    }
    return "TOTAL: " + humanBytes(bytes) + " (" + groupThousands(bytes) + " bytes; " + groupThousands(files) + " files)";
}
