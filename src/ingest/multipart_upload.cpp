#include "archivist/ingest/multipart_upload.h"

#include <utility>

namespace archivist::ingest {

core::Result<std::unique_ptr<MultipartUpload>> MultipartUpload::Begin(
    std::string_view content_type, std::string temp_path, std::uint64_t max_bytes) {
    auto boundary = ExtractBoundary(content_type);
    if (!boundary) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "expected multipart/form-data with a boundary parameter"};
    }
    return std::unique_ptr<MultipartUpload>(
        new MultipartUpload(std::move(*boundary), std::move(temp_path), max_bytes));
}

MultipartUpload::MultipartUpload(std::string boundary, std::string temp_path,
                                 std::uint64_t max_bytes)
    : parser_(std::move(boundary), max_bytes), temp_path_(std::move(temp_path)) {}

core::Result<void> MultipartUpload::Consume(std::string_view data) {
    auto step = parser_.Feed(data);
    if (!step.ok()) {
        Abort();
        return step.error();
    }
    auto applied = Apply(step.value());
    if (!applied.ok()) {
        Abort();
    }
    return applied;
}

core::Result<UploadedFile> MultipartUpload::Finish() {
    auto step = parser_.Finish();
    if (!step.ok()) {
        Abort();
        return step.error();
    }
    auto applied = Apply(step.value());
    if (!applied.ok()) {
        Abort();
        return applied.error();
    }
    if (!sink_ || !closed_) {
        Abort();
        return core::Error{core::ErrorCode::kInvalidArgument, "no file part in request"};
    }

    UploadedFile uploaded;
    uploaded.size_bytes = sink_->size();
    uploaded.filename = filename_;
    uploaded.temp_path = sink_->Release();
    sink_.reset();
    return uploaded;
}

void MultipartUpload::Abort() {
    if (sink_) {
        sink_->Discard();
        sink_.reset();
    }
}

core::Result<void> MultipartUpload::Apply(const ParseStep& step) {
    if (step.opened) {
        // The parser reaches body at most once, so at most one output file exists.
        filename_ = step.opened->filename;
        sink_ = std::make_unique<storage::TempFile>(temp_path_);
        auto opened = sink_->Open();
        if (!opened.ok()) {
            return opened;
        }
    }
    if (!step.data.empty()) {
        if (!sink_) {
            return core::Error{core::ErrorCode::kInternal, "body data without an open part"};
        }
        auto written = sink_->Write(step.data);
        if (!written.ok()) {
            return written;
        }
    }
    if (step.closed && sink_) {
        auto closed = sink_->Close();
        if (!closed.ok()) {
            return closed;
        }
        closed_ = true;
    }
    return core::Ok();
}

}  // namespace archivist::ingest
