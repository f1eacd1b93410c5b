#include "archivist/ingest/ingest_service.h"

#include <utility>

#include <boost/asio/post.hpp>

#include "archivist/core/logger.h"
#include "archivist/observability/metrics.h"

namespace archivist::ingest {

IngestService::IngestService(boost::asio::io_context& ioc, const core::IngestConfig& config,
                             std::shared_ptr<storage::ArchiveStorage> storage,
                             std::shared_ptr<catalog::ArchiveCatalog> catalog,
                             std::shared_ptr<extract::MetadataExtractor> extractor,
                             std::shared_ptr<sessions::ChunkedUploadManager> chunks)
    : ioc_(ioc),
      config_(config),
      storage_(std::move(storage)),
      catalog_(std::move(catalog)),
      extractor_(std::move(extractor)),
      chunks_(std::move(chunks)) {}

core::Result<std::unique_ptr<MultipartUpload>> IngestService::BeginUpload(
    std::string_view content_type, std::optional<std::uint64_t> content_length) {
    if (content_length && *content_length > config_.max_upload_bytes) {
        observability::RecordUploadRejected();
        return core::Error{core::ErrorCode::kPayloadTooLarge,
                           "upload exceeds " + std::to_string(config_.max_upload_bytes) +
                               " bytes"};
    }
    return MultipartUpload::Begin(content_type, storage_->NewTempPath("upload"),
                                  config_.max_upload_bytes);
}

void IngestService::FinishUpload(UploadedFile upload, StoredHandler handler) {
    auto placed = storage_->Place(upload.temp_path, upload.filename);
    if (!placed.ok()) {
        return Post(std::move(handler), placed.error());
    }
    AfterPlacement("multipart", placed.value(), std::move(handler));
}

void IngestService::CompleteSession(const std::string& session_id, StoredHandler handler) {
    if (!chunks_) {
        return Post(std::move(handler),
                    core::Error{core::ErrorCode::kNotFound, "chunked uploads are disabled"});
    }
    chunks_->Complete(session_id, [this, handler = std::move(handler)](
                                      core::Result<storage::ArchiveFile> placed) mutable {
        if (!placed.ok()) {
            return handler(placed.error());
        }
        AfterPlacement("chunked", placed.value(), std::move(handler));
    });
}

void IngestService::AfterPlacement(const std::string& mode, const storage::ArchiveFile& file,
                                   StoredHandler handler) {
    core::LogArchiveStored(mode, file.filename, file.size_bytes);
    observability::RecordArchiveStored(file.size_bytes);

    extractor_->Extract(file.filename, [this, filename = file.filename,
                                        handler = std::move(handler)](core::Result<void>) {
        // Extraction problems are already logged; the archive itself is valid without
        // sidecars.
        handler(catalog_->Describe(filename));
    });
}

void IngestService::Post(StoredHandler handler, core::Error error) {
    boost::asio::post(ioc_, [handler = std::move(handler), error = std::move(error)]() mutable {
        handler(std::move(error));
    });
}

}  // namespace archivist::ingest
