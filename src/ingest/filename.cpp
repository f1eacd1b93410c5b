#include "archivist/ingest/filename.h"

#include <algorithm>
#include <array>
#include <cctype>

#include "archivist/core/time.h"

namespace archivist::ingest {

namespace {

constexpr std::array<std::string_view, 2> kArchiveExtensions{".a3d", ".a3z"};
constexpr std::string_view kDefaultExtension = ".a3d";

bool IsSafeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

std::string ToLower(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view BaseName(std::string_view raw) {
    const auto slash = raw.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return raw;
    }
    return raw.substr(slash + 1);
}

}  // namespace

bool HasArchiveExtension(std::string_view name) {
    if (name.size() < kDefaultExtension.size()) {
        return false;
    }
    const auto ext = ToLower(name.substr(name.size() - kDefaultExtension.size()));
    return std::find(kArchiveExtensions.begin(), kArchiveExtensions.end(), ext) !=
           kArchiveExtensions.end();
}

std::string SanitizeArchiveFilename(std::string_view raw) {
    std::string name;
    for (char c : BaseName(raw)) {
        name.push_back(IsSafeChar(c) ? c : '_');
    }

    const auto first = name.find_first_not_of('.');
    if (first == std::string::npos) {
        name.clear();
    } else {
        name = name.substr(first, name.find_last_not_of('.') - first + 1);
    }

    std::string stem;
    std::string extension;
    if (HasArchiveExtension(name)) {
        stem = name.substr(0, name.size() - kDefaultExtension.size());
        extension = ToLower(name.substr(stem.size()));
    } else {
        stem = name;
        extension = std::string(kDefaultExtension);
    }
    if (stem.size() > kMaxStemLength) {
        stem.resize(kMaxStemLength);
    }

    const bool degenerate = std::none_of(stem.begin(), stem.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
    if (degenerate) {
        stem = "archive-" + std::to_string(core::NowUnixMillis());
        extension = std::string(kDefaultExtension);
    }
    return stem + extension;
}

}  // namespace archivist::ingest
