#pragma once

#include <string>

namespace archivist::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate a fresh random (version 4) UUID used as a persisted archive id.
std::string GenerateArchiveId();
/// @brief True when value has the canonical 8-4-4-4-12 shape of a version-4 UUID.
bool IsUuidV4(const std::string& value);

}  // namespace archivist::core
