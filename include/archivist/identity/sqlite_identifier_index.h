#pragma once

#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "archivist/identity/identifier_index.h"

namespace archivist::identity {

/// @brief SQLite-backed identifier index, one row per logical path.
class SqliteIdentifierIndex : public IdentifierIndex {
public:
    explicit SqliteIdentifierIndex(const std::string& db_path);

    core::Result<std::string> GetOrCreate(const std::string& logical_path) override;
    core::Result<std::string> Lookup(const std::string& logical_path) override;
    core::Result<std::string> ResolveId(const std::string& id) override;
    core::Result<void> Migrate(const std::string& old_path, const std::string& new_path) override;
    core::Result<void> Remove(const std::string& logical_path) override;

private:
    void InitSchema();
    core::Result<std::string> SelectId(const std::string& logical_path);

    // Poco::Data::Session is not safe to share between threads on its own.
    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace archivist::identity
