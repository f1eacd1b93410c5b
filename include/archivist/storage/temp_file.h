#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>

#include "archivist/core/result.h"

namespace archivist::storage {

/// @brief Write-only file that deletes itself unless released.
///
/// Used for every partially written upload (whole-file temp, chunk staging file,
/// assembly target) so that each failure or abort path removes the partial output when
/// the owner goes away.
class TempFile {
public:
    explicit TempFile(std::string path);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    core::Result<void> Open();
    core::Result<void> Write(std::string_view data);
    /// @brief Flush to stable storage and close. The file is still removed on destruction.
    core::Result<void> Close();
    /// @brief Close (if open) and give up ownership; returns the path.
    std::string Release();
    /// @brief Close and delete now.
    void Discard();

    const std::string& path() const { return path_; }
    std::uint64_t size() const { return size_; }
    bool is_open() const;

private:
    std::string path_;
    std::uint64_t size_{0};
    bool owned_{true};
#ifdef _WIN32
    std::ofstream stream_;
#else
    int fd_{-1};
#endif
};

}  // namespace archivist::storage
