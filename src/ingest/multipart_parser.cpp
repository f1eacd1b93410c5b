#include "archivist/ingest/multipart_parser.h"

#include <cctype>
#include <utility>
#include <vector>

#include "archivist/ingest/boundary_scanner.h"
#include "archivist/ingest/filename.h"

namespace archivist::ingest {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::size_t kMaxBoundaryLength = 70;

std::string_view Trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Splits "a; b=\"c;d\"; e" on semicolons that are not inside a quoted string.
std::vector<std::string_view> SplitParams(std::string_view value) {
    std::vector<std::string_view> out;
    bool quoted = false;
    bool escaped = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (escaped) {
            escaped = false;
        } else if (quoted && c == '\\') {
            escaped = true;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ';' && !quoted) {
            out.push_back(Trim(value.substr(start, i - start)));
            start = i + 1;
        }
    }
    out.push_back(Trim(value.substr(start)));
    return out;
}

std::string Unquote(std::string_view value) {
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return std::string(value);
    }
    std::string out;
    value = value.substr(1, value.size() - 2);
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            ++i;
        }
        out.push_back(value[i]);
    }
    return out;
}

struct Disposition {
    std::string name;
    std::optional<std::string> filename;
};

Disposition ParseDisposition(std::string_view header_block) {
    Disposition disposition;
    std::size_t pos = 0;
    while (pos <= header_block.size()) {
        auto end = FindSequence(header_block, kCrlf, pos);
        if (end == std::string_view::npos) {
            end = header_block.size();
        }
        const auto line = header_block.substr(pos, end - pos);
        pos = end + kCrlf.size();

        const auto colon = line.find(':');
        if (colon == std::string_view::npos ||
            !EqualsIgnoreCase(Trim(line.substr(0, colon)), "content-disposition")) {
            continue;
        }
        const auto params = SplitParams(line.substr(colon + 1));
        // params[0] is the disposition type ("form-data").
        for (std::size_t i = 1; i < params.size(); ++i) {
            const auto eq = params[i].find('=');
            if (eq == std::string_view::npos) {
                continue;
            }
            const auto key = Trim(params[i].substr(0, eq));
            const auto value = Unquote(Trim(params[i].substr(eq + 1)));
            if (EqualsIgnoreCase(key, "name")) {
                disposition.name = value;
            } else if (EqualsIgnoreCase(key, "filename")) {
                disposition.filename = value;
            }
        }
    }
    // Browsers send filename="" for an empty file input; that field carries no file.
    if (disposition.filename && disposition.filename->empty()) {
        disposition.filename.reset();
    }
    return disposition;
}

}  // namespace

const char* ParserStateName(ParserState state) {
    switch (state) {
        case ParserState::kPreamble:
            return "preamble";
        case ParserState::kHeaders:
            return "headers";
        case ParserState::kBody:
            return "body";
        case ParserState::kDone:
            return "done";
    }
    return "unknown";
}

std::optional<std::string> ExtractBoundary(std::string_view content_type) {
    const auto params = SplitParams(content_type);
    if (params.empty() || !EqualsIgnoreCase(params[0], "multipart/form-data")) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < params.size(); ++i) {
        const auto eq = params[i].find('=');
        if (eq == std::string_view::npos ||
            !EqualsIgnoreCase(Trim(params[i].substr(0, eq)), "boundary")) {
            continue;
        }
        auto boundary = Unquote(Trim(params[i].substr(eq + 1)));
        if (boundary.empty() || boundary.size() > kMaxBoundaryLength) {
            return std::nullopt;
        }
        return boundary;
    }
    return std::nullopt;
}

MultipartParser::MultipartParser(std::string boundary, std::uint64_t max_total_bytes)
    : boundary_(std::move(boundary)),
      delimiter_("--" + boundary_),
      close_delimiter_("--" + boundary_ + "--"),
      part_end_("\r\n--" + boundary_),
      max_total_bytes_(max_total_bytes) {}

core::Result<ParseStep> MultipartParser::Feed(std::string_view data) {
    if (failure_) {
        return *failure_;
    }
    // The ceiling applies to every byte received, before any of it is processed.
    total_bytes_ += data.size();
    if (total_bytes_ > max_total_bytes_) {
        return Fail(core::Error{core::ErrorCode::kPayloadTooLarge,
                                "upload exceeds limit of " + std::to_string(max_total_bytes_) +
                                    " bytes"});
    }

    ParseStep step;
    if (state_ == ParserState::kDone) {
        return step;
    }
    buffer_.append(data.data(), data.size());
    while (true) {
        auto progressed = Advance(step);
        if (!progressed.ok()) {
            return Fail(progressed.error());
        }
        if (!progressed.value()) {
            break;
        }
    }
    return step;
}

core::Result<ParseStep> MultipartParser::Finish() {
    if (failure_) {
        return *failure_;
    }
    ParseStep step;
    if (state_ == ParserState::kDone) {
        return step;
    }
    if (state_ != ParserState::kBody) {
        return Fail(core::Error{core::ErrorCode::kInvalidArgument,
                                std::string("multipart body ended in ") +
                                    ParserStateName(state_) + " before a file part"});
    }

    auto end = FindSequence(buffer_, part_end_);
    if (end == std::string::npos) {
        end = FindSequence(buffer_, close_delimiter_);
    }
    // Without any terminator the remaining bytes are kept as a best-effort completion.
    if (end == std::string::npos) {
        end = buffer_.size();
    }
    step.data.assign(buffer_, 0, end);
    step.closed = true;
    buffer_.clear();
    state_ = ParserState::kDone;
    return step;
}

core::Result<bool> MultipartParser::Advance(ParseStep& step) {
    switch (state_) {
        case ParserState::kPreamble:
            return ScanPreamble();
        case ParserState::kHeaders:
            return ScanHeaders(step);
        case ParserState::kBody:
            return ScanBody(step);
        case ParserState::kDone:
            return false;
    }
    return false;
}

core::Result<bool> MultipartParser::ScanPreamble() {
    const auto pos = FindSequence(buffer_, delimiter_);
    if (pos == std::string::npos) {
        // Keep just enough to recognise a delimiter split across two reads.
        const auto keep = boundary_.size() + 2;
        if (buffer_.size() > keep) {
            buffer_.erase(0, buffer_.size() - keep);
        }
        return false;
    }

    const auto after = pos + delimiter_.size();
    if (buffer_.size() - after < kCrlf.size()) {
        buffer_.erase(0, pos);
        return false;
    }
    if (buffer_.compare(after, kCrlf.size(), kCrlf.data(), kCrlf.size()) != 0) {
        // Either the closing delimiter before any file part, or garbage after a boundary.
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "multipart body contains no file part"};
    }
    buffer_.erase(0, after + kCrlf.size());
    state_ = ParserState::kHeaders;
    return true;
}

core::Result<bool> MultipartParser::ScanHeaders(ParseStep& step) {
    std::size_t block_end = 0;
    std::size_t consumed = 0;
    if (buffer_.size() < kCrlf.size()) {
        return false;
    }
    if (buffer_.compare(0, kCrlf.size(), kCrlf.data(), kCrlf.size()) == 0) {
        // A part with no header lines at all.
        consumed = kCrlf.size();
    } else {
        const auto pos = FindSequence(buffer_, kHeaderTerminator);
        if (pos == std::string::npos) {
            if (buffer_.size() > kMaxPartHeaderBytes) {
                return core::Error{core::ErrorCode::kInvalidArgument,
                                   "multipart part headers too large"};
            }
            return false;
        }
        if (pos > kMaxPartHeaderBytes) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "multipart part headers too large"};
        }
        block_end = pos;
        consumed = pos + kHeaderTerminator.size();
    }

    const auto disposition = ParseDisposition(std::string_view(buffer_).substr(0, block_end));
    buffer_.erase(0, consumed);
    if (!disposition.filename) {
        // Plain form fields are skipped, not stored.
        state_ = ParserState::kPreamble;
        return true;
    }

    part_ = FilePart{disposition.name, SanitizeArchiveFilename(*disposition.filename)};
    step.opened = part_;
    state_ = ParserState::kBody;
    return true;
}

bool MultipartParser::ScanBody(ParseStep& step) {
    const auto pos = FindSequence(buffer_, part_end_);
    if (pos != std::string::npos) {
        step.data.append(buffer_, 0, pos);
        step.closed = true;
        buffer_.clear();
        state_ = ParserState::kDone;
        return false;
    }

    // Hold back enough bytes to catch a part_end_ that continues in the next read.
    const auto holdback = part_end_.size() + 2;
    if (buffer_.size() > holdback) {
        const auto release = buffer_.size() - holdback;
        step.data.append(buffer_, 0, release);
        buffer_.erase(0, release);
    }
    return false;
}

core::Result<ParseStep> MultipartParser::Fail(core::Error error) {
    buffer_.clear();
    failure_ = error;
    return error;
}

}  // namespace archivist::ingest
