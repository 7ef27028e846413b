/**
 * @file remote_inventory.hpp
 * @brief Recursive listing and size tally of staged content.
 */

#ifndef REMOTE_INVENTORY_HPP
#define REMOTE_INVENTORY_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "transfer_session.hpp"

struct InventoryEntry {
    std::string path;   ///< Relative to the listed directory, '/' separated.
    std::uintmax_t size = 0;
};

class RemoteInventory {
public:
    explicit RemoteInventory(TransferSession& session) : session_(session) {}

    /**
     * @brief Lists every file below remote @p path with its size.
     *
     * The session location is restored afterwards.
     *
     * @param maxDepth Number of directory levels to open; unlimited when empty, nothing when 0.
     */
    std::expected<std::vector<InventoryEntry>, StagingError> list(const std::string& path,
                                                                  std::optional<int> maxDepth = std::nullopt);

    static std::uintmax_t totalBytes(const std::vector<InventoryEntry>& entries);

    /**
     * @brief "TOTAL: 2.1 GB (2,243,154,758 bytes; 689 files)" for text/plain,
     * "2.1 GB<TAB>2,243,154,758<TAB>689" for text/tab-separated-values.
     */
    static std::string formatTotal(std::uintmax_t bytes, std::uintmax_t files, const std::string& mimeType);

private:
    std::expected<void, StagingError> walk(const std::string& prefix,
                                           std::optional<int> depth,
                                           std::vector<InventoryEntry>& entries);

    TransferSession& session_;
};

#endif // REMOTE_INVENTORY_HPP
