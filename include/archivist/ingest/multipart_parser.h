#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "archivist/core/result.h"

namespace archivist::ingest {

/// Header block of one part may not exceed this many bytes.
constexpr std::size_t kMaxPartHeaderBytes = 16 * 1024;

/// @brief Parser phases. Transitions are linear except headers -> preamble, which skips a
/// field that carries no file.
enum class ParserState { kPreamble, kHeaders, kBody, kDone };

const char* ParserStateName(ParserState state);

/// @brief The file field selected for output.
struct FilePart {
    std::string field_name;
    /// Already sanitized with SanitizeArchiveFilename.
    std::string filename;
};

/// @brief Effects of one transition, in the order the sink must apply them: open (if
/// opened is set), append data, then close (if closed).
struct ParseStep {
    std::optional<FilePart> opened;
    std::string data;
    bool closed{false};
};

/// @brief Extract the boundary token from a Content-Type header value. Returns nullopt for a
/// non multipart/form-data type or a missing/empty boundary parameter.
std::optional<std::string> ExtractBoundary(std::string_view content_type);

/// @brief Incremental multipart/form-data parser that selects the first file-bearing field.
///
/// Memory is bounded by the last increment plus a holdback window of len(boundary)+6 bytes:
/// body bytes are released to the caller as soon as they cannot be part of a boundary
/// split across reads. The parser performs no I/O; the caller applies each ParseStep.
class MultipartParser {
public:
    MultipartParser(std::string boundary, std::uint64_t max_total_bytes);

    /// @brief Consume one network increment. Fails with kPayloadTooLarge once the running
    /// total exceeds the ceiling and kInvalidArgument for malformed input.
    core::Result<ParseStep> Feed(std::string_view data);
    /// @brief Signal end of stream. Flushes the held-back tail of an unterminated body.
    core::Result<ParseStep> Finish();

    ParserState state() const { return state_; }
    std::uint64_t total_bytes() const { return total_bytes_; }
    std::size_t buffered_bytes() const { return buffer_.size(); }
    const std::optional<FilePart>& part() const { return part_; }

private:
    core::Result<bool> Advance(ParseStep& step);
    core::Result<bool> ScanPreamble();
    core::Result<bool> ScanHeaders(ParseStep& step);
    bool ScanBody(ParseStep& step);
    core::Result<ParseStep> Fail(core::Error error);

    std::string boundary_;
    std::string delimiter_;        // "--" boundary
    std::string close_delimiter_;  // "--" boundary "--"
    std::string part_end_;         // CRLF "--" boundary
    std::uint64_t max_total_bytes_{0};

    ParserState state_{ParserState::kPreamble};
    std::string buffer_;
    std::uint64_t total_bytes_{0};
    std::optional<FilePart> part_;
    std::optional<core::Error> failure_;
};

}  // namespace archivist::ingest
