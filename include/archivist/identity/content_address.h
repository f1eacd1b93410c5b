#pragma once

#include <cstddef>
#include <string>

namespace archivist::identity {

/// Number of hex characters kept from the SHA-256 digest.
constexpr std::size_t kArchiveHashLength = 16;

/// @brief Deterministic content address of an archive: the first 16 hex characters of
/// SHA-256 over its logical URL path. Recomputed on demand, never stored.
std::string ArchiveHash(const std::string& logical_path);

/// @brief Logical URL path of an archive, e.g. "/archives/" + "scan.a3d".
std::string LogicalPath(const std::string& url_prefix, const std::string& filename);

}  // namespace archivist::identity
