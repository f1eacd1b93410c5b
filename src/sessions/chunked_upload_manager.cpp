#include "archivist/sessions/chunked_upload_manager.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "archivist/core/ids.h"
#include "archivist/core/logger.h"
#include "archivist/core/time.h"
#include "archivist/ingest/filename.h"

namespace archivist::sessions {
namespace {

std::optional<int> ParseNonNegativeInt(const std::string& value) {
    // stoi alone would also take leading whitespace and a sign.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

/// Concatenates the chunk files of one session in index order, one block per event loop turn.
class ChunkAssembler : public std::enable_shared_from_this<ChunkAssembler> {
public:
    ChunkAssembler(boost::asio::io_context& ioc, std::shared_ptr<SessionStore> store,
                   std::shared_ptr<storage::ArchiveStorage> storage, UploadSession session,
                   ChunkedUploadManager::CompletionHandler handler)
        : ioc_(ioc),
          store_(std::move(store)),
          storage_(std::move(storage)),
          session_(std::move(session)),
          handler_(std::move(handler)),
          target_(storage_->NewTempPath("assembly")),
          block_(kAssemblyBlockBytes) {}

    void Start() { ScheduleStep(); }

private:
    void ScheduleStep() {
        boost::asio::post(ioc_, [self = shared_from_this()] { self->Step(); });
    }

    void Step() {
        if (!target_.is_open()) {
            auto opened = target_.Open();
            if (!opened.ok()) {
                return Fail(opened.error());
            }
        }
        if (!input_.is_open()) {
            if (index_ == session_.total_chunks) {
                return Finish();
            }
            input_.open(store_->ChunkPath(session_.session_id, index_), std::ios::binary);
            if (!input_.is_open()) {
                return Fail(core::Error{core::ErrorCode::kIoError,
                                        "failed to read chunk " + std::to_string(index_)});
            }
        }

        input_.read(block_.data(), static_cast<std::streamsize>(block_.size()));
        const auto bytes = input_.gcount();
        if (bytes > 0) {
            auto written =
                target_.Write(std::string_view(block_.data(), static_cast<std::size_t>(bytes)));
            if (!written.ok()) {
                return Fail(written.error());
            }
        }
        if (input_.bad()) {
            return Fail(core::Error{core::ErrorCode::kIoError,
                                    "failed to read chunk " + std::to_string(index_)});
        }
        if (input_.eof()) {
            input_.close();
            input_.clear();
            ++index_;
        }
        ScheduleStep();
    }

    void Finish() {
        auto closed = target_.Close();
        if (!closed.ok()) {
            return Fail(closed.error());
        }
        const auto assembled = target_.Release();

        auto deleted = store_->Delete(session_.session_id);
        if (!deleted.ok()) {
            // The sweeper gets another chance at the directory.
            core::LogWarning(deleted.error().message);
        }
        handler_(storage_->Place(assembled, session_.filename));
    }

    void Fail(core::Error error) {
        if (input_.is_open()) {
            input_.close();
        }
        target_.Discard();
        core::LogWarning("assembly of session " + session_.session_id +
                         " failed: " + error.message);
        handler_(std::move(error));
    }

    boost::asio::io_context& ioc_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<storage::ArchiveStorage> storage_;
    UploadSession session_;
    ChunkedUploadManager::CompletionHandler handler_;
    storage::TempFile target_;
    std::vector<char> block_;
    std::ifstream input_;
    int index_{0};
};

}  // namespace

ChunkWriter::ChunkWriter(std::string staging_path, std::string chunk_path, int chunk_index,
                         std::uint64_t max_bytes)
    : staging_(std::move(staging_path)),
      chunk_path_(std::move(chunk_path)),
      chunk_index_(chunk_index),
      max_bytes_(max_bytes) {}

core::Result<void> ChunkWriter::Open() { return staging_.Open(); }

core::Result<void> ChunkWriter::Write(std::string_view data) {
    if (staging_.size() + data.size() > max_bytes_) {
        staging_.Discard();
        return core::Error{core::ErrorCode::kPayloadTooLarge,
                           "chunk exceeds " + std::to_string(max_bytes_) + " bytes"};
    }
    auto written = staging_.Write(data);
    if (!written.ok()) {
        staging_.Discard();
    }
    return written;
}

core::Result<std::uint64_t> ChunkWriter::Commit() {
    auto closed = staging_.Close();
    if (!closed.ok()) {
        staging_.Discard();
        return closed.error();
    }
    std::error_code ec;
    std::filesystem::rename(staging_.path(), chunk_path_, ec);
    if (ec) {
        staging_.Discard();
        return core::Error{core::ErrorCode::kIoError,
                           "failed to store chunk " + std::to_string(chunk_index_) + ": " +
                               ec.message()};
    }
    const auto size = staging_.size();
    staging_.Release();
    return size;
}

void ChunkWriter::Abort() { staging_.Discard(); }

ChunkedUploadManager::ChunkedUploadManager(boost::asio::io_context& ioc,
                                           std::shared_ptr<SessionStore> store,
                                           std::shared_ptr<storage::ArchiveStorage> storage,
                                           const core::IngestConfig& config)
    : ioc_(ioc), store_(std::move(store)), storage_(std::move(storage)), config_(config) {}

core::Result<ChunkRequest> ChunkedUploadManager::ParseChunkRequest(
    const std::string& session_id, const std::string& chunk_index,
    const std::string& total_chunks, const std::string& filename) const {
    if (!core::IsUuidV4(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "sessionId must be a version 4 UUID"};
    }
    if (filename.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "missing filename"};
    }
    auto index = ParseNonNegativeInt(chunk_index);
    auto total = ParseNonNegativeInt(total_chunks);
    if (!index || !total) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunkIndex and totalChunks must be integers"};
    }
    if (*total < 1 || *total > config_.max_total_chunks) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "totalChunks must be between 1 and " +
                               std::to_string(config_.max_total_chunks)};
    }
    if (*index >= *total) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunkIndex must be less than totalChunks"};
    }

    ChunkRequest request;
    request.session_id = ToLower(session_id);
    request.chunk_index = *index;
    request.total_chunks = *total;
    request.filename = ingest::SanitizeArchiveFilename(filename);
    return request;
}

core::Result<std::unique_ptr<ChunkWriter>> ChunkedUploadManager::BeginChunk(
    const ChunkRequest& request) {
    UploadSession session;
    session.session_id = request.session_id;
    session.filename = request.filename;
    session.total_chunks = request.total_chunks;
    session.created_at = core::NowIso8601();

    auto stored = store_->Create(session);
    if (!stored.ok()) {
        return stored.error();
    }
    if (request.chunk_index >= stored.value().total_chunks) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "chunkIndex " + std::to_string(request.chunk_index) +
                               " is outside session of " +
                               std::to_string(stored.value().total_chunks) + " chunks"};
    }

    auto writer = std::make_unique<ChunkWriter>(
        store_->StagingPath(request.session_id, request.chunk_index),
        store_->ChunkPath(request.session_id, request.chunk_index), request.chunk_index,
        config_.max_chunk_bytes);
    auto opened = writer->Open();
    if (!opened.ok()) {
        return opened.error();
    }
    return writer;
}

void ChunkedUploadManager::Complete(const std::string& session_id, CompletionHandler handler) {
    if (!core::IsUuidV4(session_id)) {
        return Post(std::move(handler),
                    core::Error{core::ErrorCode::kNotFound, "upload session not found"});
    }
    const auto id = ToLower(session_id);
    auto session = store_->Get(id);
    if (!session.ok()) {
        return Post(std::move(handler), session.error());
    }

    std::uint64_t total_bytes = 0;
    for (int index = 0; index < session.value().total_chunks; ++index) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(store_->ChunkPath(id, index), ec);
        if (ec) {
            return Post(std::move(handler),
                        core::Error{core::ErrorCode::kIncomplete,
                                    "missing chunk " + std::to_string(index)});
        }
        total_bytes += size;
    }
    if (config_.max_session_bytes > 0 && total_bytes > config_.max_session_bytes) {
        return Post(std::move(handler),
                    core::Error{core::ErrorCode::kPayloadTooLarge,
                                "session exceeds " + std::to_string(config_.max_session_bytes) +
                                    " bytes"});
    }
    if (storage_->Exists(session.value().filename)) {
        return Post(std::move(handler),
                    core::Error{core::ErrorCode::kAlreadyExists,
                                "archive " + session.value().filename + " already exists"});
    }

    std::make_shared<ChunkAssembler>(ioc_, store_, storage_, std::move(session.value()),
                                     std::move(handler))
        ->Start();
}

void ChunkedUploadManager::Post(CompletionHandler handler, core::Error error) {
    boost::asio::post(ioc_, [handler = std::move(handler), error = std::move(error)]() mutable {
        handler(std::move(error));
    });
}

}  // namespace archivist::sessions
