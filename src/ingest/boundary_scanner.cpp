#include "archivist/ingest/boundary_scanner.h"

#include <algorithm>
#include <functional>

namespace archivist::ingest {

std::size_t FindSequence(std::string_view haystack, std::string_view needle, std::size_t from) {
    if (needle.empty() || from >= haystack.size() || haystack.size() - from < needle.size()) {
        return std::string_view::npos;
    }
    const auto begin = haystack.begin() + static_cast<std::ptrdiff_t>(from);
    const auto it = std::search(begin, haystack.end(),
                                std::boyer_moore_horspool_searcher(needle.begin(), needle.end()));
    if (it == haystack.end()) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

}  // namespace archivist::ingest
