#include "archivist/catalog/archive_catalog.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Parser.h>

#include "archivist/core/ids.h"
#include "archivist/core/logger.h"
#include "archivist/identity/content_address.h"
#include "archivist/ingest/filename.h"

namespace archivist::catalog {
namespace {

struct Sidecar {
    std::string title;
    std::string thumbnail;
};

Poco::JSON::Object::Ptr ReadJsonFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return nullptr;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        Poco::JSON::Parser parser;
        return parser.parse(ss.str()).extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception& ex) {
        core::LogWarning("ignoring unreadable sidecar " + path + ": " + ex.displayText());
        return nullptr;
    }
}

std::optional<Sidecar> ReadSidecar(const std::string& path) {
    auto obj = ReadJsonFile(path);
    if (!obj) {
        return std::nullopt;
    }
    Sidecar sidecar;
    try {
        sidecar.title = obj->optValue<std::string>("title", "");
        sidecar.thumbnail = obj->optValue<std::string>("thumbnail", "");
    } catch (const Poco::Exception& ex) {
        core::LogWarning("ignoring malformed sidecar " + path + ": " + ex.displayText());
        return std::nullopt;
    }
    return sidecar;
}

std::string Stem(const std::string& filename) {
    if (ingest::HasArchiveExtension(filename)) {
        return filename.substr(0, filename.size() - 4);
    }
    return filename;
}

bool IsArchiveHash(const std::string& key) {
    if (key.size() != identity::kArchiveHashLength) {
        return false;
    }
    for (char c : key) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) ||
            std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string ThumbnailUrl(const std::string& hash) { return "/thumbs/" + hash + ".jpg"; }

}  // namespace

Poco::JSON::Object::Ptr ArchiveRecord::ToJson() const {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("hash", hash);
    obj->set("uuid", uuid);
    obj->set("filename", filename);
    obj->set("path", path);
    obj->set("title", title);
    obj->set("size", size_bytes);
    obj->set("modified", modified);
    if (thumbnail) {
        obj->set("thumbnail", *thumbnail);
    } else {
        obj->set("thumbnail", Poco::Dynamic::Var());
    }
    obj->set("viewerUrl", viewer_url);
    return obj;
}

ArchiveCatalog::ArchiveCatalog(std::shared_ptr<storage::ArchiveStorage> storage,
                               std::shared_ptr<identity::IdentifierIndex> ids,
                               core::StorageConfig config)
    : storage_(std::move(storage)), ids_(std::move(ids)), config_(std::move(config)) {}

core::Result<ArchiveRecord> ArchiveCatalog::Describe(const storage::ArchiveFile& file) {
    ArchiveRecord record;
    record.filename = file.filename;
    record.path = identity::LogicalPath(config_.url_prefix, file.filename);
    record.hash = identity::ArchiveHash(record.path);
    record.size_bytes = file.size_bytes;
    record.modified = file.modified;
    record.viewer_url = "/?archive=" + record.path;

    auto id = ids_->GetOrCreate(record.path);
    if (!id.ok()) {
        return id.error();
    }
    record.uuid = id.value();

    record.title = Stem(file.filename);
    auto sidecar = ReadSidecar(MetaPath(record.hash));
    if (sidecar) {
        if (!sidecar->title.empty()) {
            record.title = sidecar->title;
        }
        if (!sidecar->thumbnail.empty()) {
            record.thumbnail = sidecar->thumbnail;
        }
    }
    return record;
}

core::Result<ArchiveRecord> ArchiveCatalog::Describe(const std::string& filename) {
    auto file = storage_->Stat(filename);
    if (!file.ok()) {
        return file.error();
    }
    return Describe(file.value());
}

core::Result<ArchiveListing> ArchiveCatalog::List() {
    auto files = storage_->List();
    if (!files.ok()) {
        return files.error();
    }
    ArchiveListing listing;
    for (const auto& file : files.value()) {
        auto record = Describe(file);
        if (!record.ok()) {
            return record.error();
        }
        listing.storage_used += file.size_bytes;
        listing.archives.push_back(std::move(record.value()));
    }
    return listing;
}

core::Result<std::string> ArchiveCatalog::ResolveKey(const std::string& key) {
    if (IsArchiveHash(key)) {
        auto files = storage_->List();
        if (!files.ok()) {
            return files.error();
        }
        for (const auto& file : files.value()) {
            if (identity::ArchiveHash(identity::LogicalPath(config_.url_prefix, file.filename)) ==
                key) {
                return file.filename;
            }
        }
        return core::Error{core::ErrorCode::kNotFound, "archive not found"};
    }

    if (core::IsUuidV4(key)) {
        auto logical_path = ids_->ResolveId(key);
        if (!logical_path.ok()) {
            return logical_path.error();
        }
        const auto& path = logical_path.value();
        if (path.compare(0, config_.url_prefix.size(), config_.url_prefix) == 0) {
            const auto filename = path.substr(config_.url_prefix.size());
            if (storage_->Exists(filename)) {
                return filename;
            }
        }
    }
    return core::Error{core::ErrorCode::kNotFound, "archive not found"};
}

core::Result<void> ArchiveCatalog::Delete(const std::string& key) {
    auto filename = ResolveKey(key);
    if (!filename.ok()) {
        return filename.error();
    }
    auto removed = storage_->Remove(filename.value());
    if (!removed.ok()) {
        return removed;
    }

    const auto logical_path = identity::LogicalPath(config_.url_prefix, filename.value());
    RemoveSidecars(identity::ArchiveHash(logical_path));
    auto unmapped = ids_->Remove(logical_path);
    if (!unmapped.ok()) {
        core::LogError("failed to drop id of " + logical_path + ": " + unmapped.error().message);
    }
    core::LogInfo("Deleted archive " + filename.value());
    return core::Ok();
}

core::Result<ArchiveRecord> ArchiveCatalog::Rename(const std::string& key,
                                                   const std::string& new_filename) {
    if (new_filename.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "missing filename"};
    }
    auto old_filename = ResolveKey(key);
    if (!old_filename.ok()) {
        return old_filename.error();
    }
    const auto target = ingest::SanitizeArchiveFilename(new_filename);
    if (target == old_filename.value()) {
        return Describe(target);
    }

    auto renamed = storage_->Rename(old_filename.value(), target);
    if (!renamed.ok()) {
        return renamed.error();
    }

    const auto old_path = identity::LogicalPath(config_.url_prefix, old_filename.value());
    const auto new_path = identity::LogicalPath(config_.url_prefix, target);
    auto migrated = ids_->Migrate(old_path, new_path);
    if (!migrated.ok()) {
        core::LogError("failed to migrate id of " + old_path + ": " + migrated.error().message);
    }
    MoveSidecars(identity::ArchiveHash(old_path), identity::ArchiveHash(new_path), new_path);
    core::LogInfo("Renamed archive " + old_filename.value() + " to " + target);
    return Describe(renamed.value());
}

std::string ArchiveCatalog::MetaPath(const std::string& hash) const {
    return (std::filesystem::path(config_.meta_path) / (hash + ".json")).string();
}

std::string ArchiveCatalog::ThumbPath(const std::string& hash) const {
    return (std::filesystem::path(config_.thumbs_path) / (hash + ".jpg")).string();
}

void ArchiveCatalog::MoveSidecars(const std::string& old_hash, const std::string& new_hash,
                                  const std::string& new_logical_path) {
    std::error_code ec;
    const bool has_thumb = std::filesystem::exists(ThumbPath(old_hash), ec);
    if (has_thumb) {
        std::filesystem::rename(ThumbPath(old_hash), ThumbPath(new_hash), ec);
        if (ec) {
            core::LogWarning("failed to move thumbnail " + ThumbPath(old_hash) + ": " +
                             ec.message());
        }
    }

    auto meta = ReadJsonFile(MetaPath(old_hash));
    if (!meta) {
        return;
    }
    // The sidecar names its own archive and thumbnail by URL.
    meta->set("archive_url", new_logical_path);
    if (has_thumb && !meta->optValue<std::string>("thumbnail", "").empty()) {
        meta->set("thumbnail", ThumbnailUrl(new_hash));
    }
    {
        std::ofstream out(MetaPath(new_hash), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            core::LogWarning("failed to write sidecar " + MetaPath(new_hash));
            return;
        }
        meta->stringify(out, 2);
    }
    std::filesystem::remove(MetaPath(old_hash), ec);
}

void ArchiveCatalog::RemoveSidecars(const std::string& hash) {
    std::error_code ec;
    std::filesystem::remove(MetaPath(hash), ec);
    if (ec) {
        core::LogWarning("failed to remove sidecar " + MetaPath(hash) + ": " + ec.message());
    }
    std::filesystem::remove(ThumbPath(hash), ec);
    if (ec) {
        core::LogWarning("failed to remove thumbnail " + ThumbPath(hash) + ": " + ec.message());
    }
}

}  // namespace archivist::catalog
