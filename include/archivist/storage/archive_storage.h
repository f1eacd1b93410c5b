#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "archivist/core/error.h"
#include "archivist/core/result.h"

namespace archivist::storage {

/// @brief A file in the archive collection directory.
struct ArchiveFile {
    std::string filename;
    std::string path;
    std::uint64_t size_bytes{0};
    std::string modified;
};

/// @brief Archive collection directory plus the temp area used to stage uploads.
///
/// Placement is check-then-rename: two concurrent placements of the same name can both
/// pass the existence check, and the later rename wins.
class ArchiveStorage {
public:
    ArchiveStorage(std::string archive_path, std::string temp_path);

    bool Exists(const std::string& filename) const;
    /// @brief Move a finished temp file into the collection under filename.
    ///
    /// The source is consumed: it is removed on every failure path. Fails with
    /// kAlreadyExists when filename is taken, leaving the existing archive untouched.
    core::Result<ArchiveFile> Place(const std::string& source_path, const std::string& filename);
    core::Result<ArchiveFile> Stat(const std::string& filename) const;
    /// @brief All files with a recognised archive extension, sorted by name.
    core::Result<std::vector<ArchiveFile>> List() const;
    core::Result<void> Remove(const std::string& filename);
    core::Result<ArchiveFile> Rename(const std::string& from, const std::string& to);

    /// @brief Unique path in the temp area, e.g. for an upload in flight.
    std::string NewTempPath(const std::string& tag) const;

    const std::string& archive_path() const { return archive_path_; }
    const std::string& temp_path() const { return temp_path_; }

    static bool IsSafeName(const std::string& name);
    /// @brief rename(2), falling back to copy + delete when source and target are on
    /// different filesystems.
    static core::Result<void> MoveFile(const std::string& from, const std::string& to);

private:
    std::string PathFor(const std::string& filename) const;

    std::string archive_path_;
    std::string temp_path_;
};

}  // namespace archivist::storage
