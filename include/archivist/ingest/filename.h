#pragma once

#include <string>
#include <string_view>

namespace archivist::ingest {

/// Longest stem (name without extension) kept by SanitizeArchiveFilename.
constexpr std::size_t kMaxStemLength = 200;

/// @brief True when name ends with a recognised archive extension (.a3d / .a3z, any case).
bool HasArchiveExtension(std::string_view name);

/// @brief Map any client-supplied filename to a safe archive filename.
///
/// Strips directory components, replaces bytes outside [A-Za-z0-9._-] with '_', trims
/// leading/trailing dots, forces a lower-case .a3d/.a3z extension and bounds the stem length.
/// A stem without any alphanumeric character is replaced by a synthetic
/// "archive-<unix-millis>" stem. The mapping is total and idempotent.
std::string SanitizeArchiveFilename(std::string_view raw);

}  // namespace archivist::ingest
