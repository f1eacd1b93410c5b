#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "archivist/core/result.h"
#include "archivist/ingest/multipart_parser.h"
#include "archivist/storage/temp_file.h"

namespace archivist::ingest {

/// @brief A fully received upload waiting to be placed in the archive collection.
struct UploadedFile {
    std::string temp_path;
    std::string filename;
    std::uint64_t size_bytes{0};
};

/// @brief One whole-file upload in flight: feeds request body increments through a
/// MultipartParser and applies its steps to a temp file.
///
/// Destroying an unfinished upload removes its partial output.
class MultipartUpload {
public:
    /// @brief Validates the Content-Type before any body byte is read.
    static core::Result<std::unique_ptr<MultipartUpload>> Begin(std::string_view content_type,
                                                                std::string temp_path,
                                                                std::uint64_t max_bytes);

    core::Result<void> Consume(std::string_view data);
    /// @brief End of request body; on success the caller owns the returned temp file.
    core::Result<UploadedFile> Finish();
    void Abort();

    const MultipartParser& parser() const { return parser_; }

private:
    MultipartUpload(std::string boundary, std::string temp_path, std::uint64_t max_bytes);
    core::Result<void> Apply(const ParseStep& step);

    MultipartParser parser_;
    std::string temp_path_;
    std::unique_ptr<storage::TempFile> sink_;
    std::string filename_;
    bool closed_{false};
};

}  // namespace archivist::ingest
