#include "archivist/identity/sqlite_identifier_index.h"

#include <filesystem>

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/Statement.h>

#include "archivist/core/ids.h"
#include "archivist/core/time.h"

namespace {
using namespace Poco::Data::Keywords;
}

namespace archivist::identity {

SqliteIdentifierIndex::SqliteIdentifierIndex(const std::string& db_path)
    : session_([](const std::string& path) {
          const auto parent = std::filesystem::path(path).parent_path();
          if (!parent.empty()) {
              std::filesystem::create_directories(parent);
          }
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteIdentifierIndex::InitSchema() {
    session_ <<
            "CREATE TABLE IF NOT EXISTS archive_ids ("
            "logical_path TEXT PRIMARY KEY,"
            "archive_id TEXT NOT NULL UNIQUE,"
            "created_at TEXT NOT NULL"
            ")",
        now;
}

core::Result<std::string> SqliteIdentifierIndex::SelectId(const std::string& logical_path) {
    std::string id;
    std::string path_value = logical_path;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT archive_id FROM archive_ids WHERE logical_path = ?", use(path_value),
            into(id), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    if (id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "no id for " + logical_path};
    }
    return id;
}

core::Result<std::string> SqliteIdentifierIndex::GetOrCreate(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = SelectId(logical_path);
    if (existing.ok() || existing.error().code != core::ErrorCode::kNotFound) {
        return existing;
    }

    try {
        std::string path_value = logical_path;
        std::string id_value = core::GenerateArchiveId();
        std::string created_at = core::NowIso8601();
        session_ << "INSERT OR IGNORE INTO archive_ids(logical_path, archive_id, created_at) "
                    "VALUES(?, ?, ?)",
            use(path_value), use(id_value), use(created_at), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return SelectId(logical_path);
}

core::Result<std::string> SqliteIdentifierIndex::Lookup(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return SelectId(logical_path);
}

core::Result<std::string> SqliteIdentifierIndex::ResolveId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string logical_path;
    std::string id_value = id;
    try {
        Poco::Data::Statement select(session_);
        select << "SELECT logical_path FROM archive_ids WHERE archive_id = ?", use(id_value),
            into(logical_path), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    if (logical_path.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "unknown archive id"};
    }
    return logical_path;
}

core::Result<void> SqliteIdentifierIndex::Migrate(const std::string& old_path,
                                                  const std::string& new_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = SelectId(old_path);
    if (!existing.ok()) {
        if (existing.error().code == core::ErrorCode::kNotFound) {
            return core::Ok();
        }
        return existing.error();
    }

    std::string old_value = old_path;
    std::string new_value = new_path;
    try {
        session_.begin();
        session_ << "DELETE FROM archive_ids WHERE logical_path = ?", use(new_value), now;
        session_ << "UPDATE archive_ids SET logical_path = ? WHERE logical_path = ?",
            use(new_value), use(old_value), now;
        session_.commit();
    } catch (const Poco::Exception& ex) {
        if (session_.isTransaction()) {
            session_.rollback();
        }
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<void> SqliteIdentifierIndex::Remove(const std::string& logical_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string path_value = logical_path;
        session_ << "DELETE FROM archive_ids WHERE logical_path = ?", use(path_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

}  // namespace archivist::identity
