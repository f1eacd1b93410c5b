#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "archivist/catalog/archive_catalog.h"
#include "archivist/core/config.h"
#include "archivist/core/result.h"
#include "archivist/extract/metadata_extractor.h"
#include "archivist/ingest/multipart_upload.h"
#include "archivist/sessions/chunked_upload_manager.h"
#include "archivist/storage/archive_storage.h"

namespace archivist::ingest {

/// @brief Both upload paths up to the stored-archive descriptor: placement, metadata
/// extraction, id assignment.
class IngestService {
public:
    using StoredHandler = std::function<void(core::Result<catalog::ArchiveRecord>)>;

    /// @brief chunks may be null when chunked mode is disabled.
    IngestService(boost::asio::io_context& ioc, const core::IngestConfig& config,
                  std::shared_ptr<storage::ArchiveStorage> storage,
                  std::shared_ptr<catalog::ArchiveCatalog> catalog,
                  std::shared_ptr<extract::MetadataExtractor> extractor,
                  std::shared_ptr<sessions::ChunkedUploadManager> chunks);

    /// @brief Start a whole-file upload. Rejects a missing boundary (kInvalidArgument) and a
    /// declared length above the ceiling (kPayloadTooLarge) before any body byte is read.
    core::Result<std::unique_ptr<MultipartUpload>> BeginUpload(
        std::string_view content_type, std::optional<std::uint64_t> content_length);
    /// @brief Place a received upload and describe it once extraction has run.
    void FinishUpload(UploadedFile upload, StoredHandler handler);

    bool chunked_enabled() const { return chunks_ != nullptr; }
    sessions::ChunkedUploadManager* chunks() const { return chunks_.get(); }
    void CompleteSession(const std::string& session_id, StoredHandler handler);

    const core::IngestConfig& config() const { return config_; }

private:
    void AfterPlacement(const std::string& mode, const storage::ArchiveFile& file,
                        StoredHandler handler);
    void Post(StoredHandler handler, core::Error error);

    boost::asio::io_context& ioc_;
    core::IngestConfig config_;
    std::shared_ptr<storage::ArchiveStorage> storage_;
    std::shared_ptr<catalog::ArchiveCatalog> catalog_;
    std::shared_ptr<extract::MetadataExtractor> extractor_;
    std::shared_ptr<sessions::ChunkedUploadManager> chunks_;
};

}  // namespace archivist::ingest
