#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "archivist/core/config.h"
#include "archivist/core/result.h"
#include "archivist/sessions/session_store.h"
#include "archivist/storage/archive_storage.h"
#include "archivist/storage/temp_file.h"

namespace archivist::sessions {

/// Bytes copied per event loop turn while concatenating chunks.
constexpr std::size_t kAssemblyBlockBytes = 1024 * 1024;

/// @brief Validated parameters of one chunk submission.
struct ChunkRequest {
    /// Lower-cased version-4 UUID.
    std::string session_id;
    int chunk_index{0};
    int total_chunks{0};
    /// Sanitized target filename.
    std::string filename;
};

/// @brief Receives the body of one chunk into a staging file next to the final chunk file.
///
/// The staging file is removed unless Commit succeeds, so an aborted or oversized resend
/// leaves an earlier good copy of the same index in place.
class ChunkWriter {
public:
    ChunkWriter(std::string staging_path, std::string chunk_path, int chunk_index,
                std::uint64_t max_bytes);

    core::Result<void> Open();
    /// @brief Fails with kPayloadTooLarge (and drops the staging file) past the ceiling.
    core::Result<void> Write(std::string_view data);
    /// @brief Flush and rename the staging file over the chunk file. Returns its size.
    core::Result<std::uint64_t> Commit();
    void Abort();

    int chunk_index() const { return chunk_index_; }
    std::uint64_t size() const { return staging_.size(); }

private:
    storage::TempFile staging_;
    std::string chunk_path_;
    int chunk_index_{0};
    std::uint64_t max_bytes_{0};
};

/// @brief Accepts files as independently uploaded, index-tagged chunks and reassembles them
/// once every declared index is present.
class ChunkedUploadManager {
public:
    using CompletionHandler = std::function<void(core::Result<storage::ArchiveFile>)>;

    ChunkedUploadManager(boost::asio::io_context& ioc, std::shared_ptr<SessionStore> store,
                         std::shared_ptr<storage::ArchiveStorage> storage,
                         const core::IngestConfig& config);

    /// @brief Validate raw query parameters: a version-4 UUID session id, a filename and
    /// 0 <= chunkIndex < totalChunks <= max_total_chunks.
    core::Result<ChunkRequest> ParseChunkRequest(const std::string& session_id,
                                                 const std::string& chunk_index,
                                                 const std::string& total_chunks,
                                                 const std::string& filename) const;

    /// @brief Create the session on its first chunk and open a writer for this chunk.
    core::Result<std::unique_ptr<ChunkWriter>> BeginChunk(const ChunkRequest& request);

    /// @brief Verify, concatenate in index order and place the session's file.
    ///
    /// The copy runs in bounded blocks posted to the io_context. handler is always invoked
    /// from the io_context, never from inside this call. A failed completion leaves the
    /// archive collection untouched; an incomplete session is left intact for retries.
    void Complete(const std::string& session_id, CompletionHandler handler);

    const core::IngestConfig& config() const { return config_; }

private:
    void Post(CompletionHandler handler, core::Error error);

    boost::asio::io_context& ioc_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<storage::ArchiveStorage> storage_;
    core::IngestConfig config_;
};

}  // namespace archivist::sessions
