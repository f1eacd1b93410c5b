#pragma once

#include <memory>
#include <string>

#include "archivist/core/config.h"
#include "archivist/core/result.h"

namespace archivist::identity {

/// @brief Durable mapping from an archive's logical path to its opaque id.
///
/// Implementations serialize their read-modify-write cycle so concurrent mutations never
/// lose an update.
class IdentifierIndex {
public:
    virtual ~IdentifierIndex() = default;

    /// @brief Existing id for logical_path, or a freshly minted one that has already been
    /// persisted when this returns.
    virtual core::Result<std::string> GetOrCreate(const std::string& logical_path) = 0;
    /// @brief kNotFound when logical_path has no id.
    virtual core::Result<std::string> Lookup(const std::string& logical_path) = 0;
    /// @brief Reverse lookup: the logical path that owns id, or kNotFound.
    virtual core::Result<std::string> ResolveId(const std::string& id) = 0;
    /// @brief Move the id of old_path to new_path (archive rename). A missing old entry is
    /// not an error; an existing new entry is replaced.
    virtual core::Result<void> Migrate(const std::string& old_path,
                                       const std::string& new_path) = 0;
    /// @brief Drop the entry for logical_path (archive delete). Missing entries are ignored.
    virtual core::Result<void> Remove(const std::string& logical_path) = 0;
};

/// @brief Build the backend named in config ("file" or "sqlite").
std::shared_ptr<IdentifierIndex> MakeIdentifierIndex(const core::IdentifierConfig& config);

}  // namespace archivist::identity
