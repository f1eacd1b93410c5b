#pragma once

#include <map>
#include <mutex>
#include <string>

#include "archivist/identity/identifier_index.h"

namespace archivist::identity {

/// @brief Identifier index kept as one JSON object file {"<logical path>": "<id>", ...}.
///
/// Every mutation rereads the file, applies the change and rewrites it wholesale through a
/// temp file + rename, all under one mutex.
class FileIdentifierIndex : public IdentifierIndex {
public:
    explicit FileIdentifierIndex(std::string path);

    core::Result<std::string> GetOrCreate(const std::string& logical_path) override;
    core::Result<std::string> Lookup(const std::string& logical_path) override;
    core::Result<std::string> ResolveId(const std::string& id) override;
    core::Result<void> Migrate(const std::string& old_path, const std::string& new_path) override;
    core::Result<void> Remove(const std::string& logical_path) override;

private:
    using Mapping = std::map<std::string, std::string>;

    core::Result<Mapping> Load() const;
    core::Result<void> Save(const Mapping& mapping) const;

    std::string path_;
    std::mutex mutex_;
};

}  // namespace archivist::identity
