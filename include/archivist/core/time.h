#pragma once

#include <string>

#include <Poco/Timestamp.h>

namespace archivist::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Formats a timestamp (e.g. a file modification time) as ISO8601 UTC.
std::string FormatIso8601(const Poco::Timestamp& timestamp);
/// @brief Milliseconds since the Unix epoch, used for synthetic names.
long long NowUnixMillis();

}  // namespace archivist::core
