#include "archivist/storage/archive_storage.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

#include <Poco/File.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/core/logger.h"
#include "archivist/core/time.h"
#include "archivist/ingest/filename.h"

namespace archivist::storage {

namespace {

void RemoveQuietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        core::LogWarning("failed to remove " + path + ": " + ec.message());
    }
}

core::Result<ArchiveFile> Describe(const std::string& filename, const std::string& path) {
    try {
        Poco::File file(path);
        if (!file.exists() || !file.isFile()) {
            return core::Error{core::ErrorCode::kNotFound, "archive not found"};
        }
        ArchiveFile archive;
        archive.filename = filename;
        archive.path = path;
        archive.size_bytes = static_cast<std::uint64_t>(file.getSize());
        archive.modified = core::FormatIso8601(file.getLastModified());
        return archive;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError, ex.displayText()};
    }
}

}  // namespace

ArchiveStorage::ArchiveStorage(std::string archive_path, std::string temp_path)
    : archive_path_(std::move(archive_path)), temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(archive_path_);
    std::filesystem::create_directories(temp_path_);
}

bool ArchiveStorage::Exists(const std::string& filename) const {
    std::error_code ec;
    return std::filesystem::exists(PathFor(filename), ec);
}

core::Result<ArchiveFile> ArchiveStorage::Place(const std::string& source_path,
                                                const std::string& filename) {
    if (!IsSafeName(filename)) {
        RemoveQuietly(source_path);
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid archive filename"};
    }
    if (Exists(filename)) {
        RemoveQuietly(source_path);
        return core::Error{core::ErrorCode::kAlreadyExists,
                           "archive " + filename + " already exists"};
    }

    const auto final_path = PathFor(filename);
    auto moved = MoveFile(source_path, final_path);
    if (!moved.ok()) {
        RemoveQuietly(source_path);
        return moved.error();
    }
    return Describe(filename, final_path);
}

core::Result<ArchiveFile> ArchiveStorage::Stat(const std::string& filename) const {
    if (!IsSafeName(filename)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid archive filename"};
    }
    return Describe(filename, PathFor(filename));
}

core::Result<std::vector<ArchiveFile>> ArchiveStorage::List() const {
    std::vector<ArchiveFile> archives;
    std::error_code ec;
    std::filesystem::directory_iterator it(archive_path_, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "failed to list archives: " + ec.message()};
    }
    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !ingest::HasArchiveExtension(name)) {
            continue;
        }
        auto described = Describe(name, entry.path().string());
        if (described.ok()) {
            archives.push_back(std::move(described.value()));
        }
    }
    std::sort(archives.begin(), archives.end(),
              [](const ArchiveFile& a, const ArchiveFile& b) { return a.filename < b.filename; });
    return archives;
}

core::Result<void> ArchiveStorage::Remove(const std::string& filename) {
    if (!IsSafeName(filename)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid archive filename"};
    }
    std::error_code ec;
    if (!std::filesystem::remove(PathFor(filename), ec)) {
        if (ec) {
            return core::Error{core::ErrorCode::kIoError, ec.message()};
        }
        return core::Error{core::ErrorCode::kNotFound, "archive not found"};
    }
    return core::Ok();
}

core::Result<ArchiveFile> ArchiveStorage::Rename(const std::string& from, const std::string& to) {
    if (!IsSafeName(from) || !IsSafeName(to)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid archive filename"};
    }
    if (!Exists(from)) {
        return core::Error{core::ErrorCode::kNotFound, "archive not found"};
    }
    if (Exists(to)) {
        return core::Error{core::ErrorCode::kAlreadyExists, "archive " + to + " already exists"};
    }
    std::error_code ec;
    std::filesystem::rename(PathFor(from), PathFor(to), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, "rename failed: " + ec.message()};
    }
    return Describe(to, PathFor(to));
}

std::string ArchiveStorage::NewTempPath(const std::string& tag) const {
    return (std::filesystem::path(temp_path_) /
            (tag + "-" + Poco::UUIDGenerator().createOne().toString()))
        .string();
}

bool ArchiveStorage::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

core::Result<void> ArchiveStorage::MoveFile(const std::string& from, const std::string& to) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(to).parent_path(), ec);
    ec.clear();
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return core::Ok();
    }
    if (ec != std::errc::cross_device_link) {
        return core::Error{core::ErrorCode::kIoError, "rename failed: " + ec.message()};
    }

    // Temp space and collection live on different filesystems.
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
    if (ec) {
        if (ec != std::errc::file_exists) {
            RemoveQuietly(to);
        }
        return core::Error{core::ErrorCode::kIoError, "copy failed: " + ec.message()};
    }
    RemoveQuietly(from);
    return core::Ok();
}

std::string ArchiveStorage::PathFor(const std::string& filename) const {
    return (std::filesystem::path(archive_path_) / filename).string();
}

}  // namespace archivist::storage
