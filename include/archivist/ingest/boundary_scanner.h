#pragma once

#include <cstddef>
#include <string_view>

namespace archivist::ingest {

/// @brief Offset of the first occurrence of needle in haystack at or after from,
/// or std::string_view::npos. An empty needle never matches.
std::size_t FindSequence(std::string_view haystack, std::string_view needle,
                         std::size_t from = 0);

}  // namespace archivist::ingest
