#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <Poco/JSON/Object.h>

#include "archivist/core/config.h"
#include "archivist/core/result.h"
#include "archivist/identity/identifier_index.h"
#include "archivist/storage/archive_storage.h"

namespace archivist::catalog {

/// @brief Client-facing description of one stored archive.
struct ArchiveRecord {
    std::string hash;
    std::string uuid;
    std::string filename;
    /// Logical URL path, e.g. "/archives/scan.a3d".
    std::string path;
    std::string title;
    std::uint64_t size_bytes{0};
    std::string modified;
    std::optional<std::string> thumbnail;
    std::string viewer_url;

    Poco::JSON::Object::Ptr ToJson() const;
};

struct ArchiveListing {
    std::vector<ArchiveRecord> archives;
    std::uint64_t storage_used{0};
};

/// @brief Archive collection seen through its two addresses (content hash and persisted id)
/// plus the sidecar files written by the metadata extractor.
class ArchiveCatalog {
public:
    ArchiveCatalog(std::shared_ptr<storage::ArchiveStorage> storage,
                   std::shared_ptr<identity::IdentifierIndex> ids, core::StorageConfig config);

    /// @brief Build the descriptor, minting the persisted id on first sight.
    core::Result<ArchiveRecord> Describe(const storage::ArchiveFile& file);
    core::Result<ArchiveRecord> Describe(const std::string& filename);
    core::Result<ArchiveListing> List();

    /// @brief Filename addressed by key, a content hash or a persisted id.
    core::Result<std::string> ResolveKey(const std::string& key);
    /// @brief Remove the archive, its sidecars and its id mapping.
    core::Result<void> Delete(const std::string& key);
    /// @brief Rename to the sanitized form of new_filename, carrying the persisted id and the
    /// sidecars over to the new content hash.
    core::Result<ArchiveRecord> Rename(const std::string& key, const std::string& new_filename);

private:
    std::string MetaPath(const std::string& hash) const;
    std::string ThumbPath(const std::string& hash) const;
    void MoveSidecars(const std::string& old_hash, const std::string& new_hash,
                      const std::string& new_logical_path);
    void RemoveSidecars(const std::string& hash);

    std::shared_ptr<storage::ArchiveStorage> storage_;
    std::shared_ptr<identity::IdentifierIndex> ids_;
    core::StorageConfig config_;
};

}  // namespace archivist::catalog
