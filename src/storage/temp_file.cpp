#include "archivist/storage/temp_file.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace archivist::storage {

TempFile::TempFile(std::string path) : path_(std::move(path)) {}

TempFile::~TempFile() {
    if (owned_) {
        Discard();
    }
}

bool TempFile::is_open() const {
#ifdef _WIN32
    return stream_.is_open();
#else
    return fd_ >= 0;
#endif
}

core::Result<void> TempFile::Open() {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path_).parent_path(), ec);
#ifdef _WIN32
    stream_.open(path_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
#else
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd_ < 0) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to open temp file: " + std::string(std::strerror(errno))};
    }
#endif
    size_ = 0;
    return core::Ok();
}

core::Result<void> TempFile::Write(std::string_view data) {
    if (!is_open()) {
        return core::Error{core::ErrorCode::kIoError, "temp file is not open"};
    }
#ifdef _WIN32
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
    }
#else
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return core::Error{core::ErrorCode::kIoError,
                               "failed to write temp file: " + std::string(std::strerror(errno))};
        }
        offset += static_cast<std::size_t>(written);
    }
#endif
    size_ += data.size();
    return core::Ok();
}

core::Result<void> TempFile::Close() {
    if (!is_open()) {
        return core::Ok();
    }
#ifdef _WIN32
    stream_.flush();
    const bool good = static_cast<bool>(stream_);
    stream_.close();
    if (!good) {
        return core::Error{core::ErrorCode::kIoError, "failed to flush temp file"};
    }
#else
    const int synced = ::fsync(fd_);
    const int closed = ::close(fd_);
    fd_ = -1;
    if (synced != 0 || closed != 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to flush temp file"};
    }
#endif
    return core::Ok();
}

std::string TempFile::Release() {
#ifdef _WIN32
    if (stream_.is_open()) {
        stream_.close();
    }
#else
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
    owned_ = false;
    return path_;
}

void TempFile::Discard() {
#ifdef _WIN32
    if (stream_.is_open()) {
        stream_.close();
    }
#else
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
    if (owned_) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        owned_ = false;
    }
}

}  // namespace archivist::storage
