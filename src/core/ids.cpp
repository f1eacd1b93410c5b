#include "archivist/core/ids.h"

#include <cctype>

#include <Poco/UUIDGenerator.h>

namespace archivist::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateArchiveId() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

bool IsUuidV4(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    // Version nibble and RFC 4122 variant bits.
    if (value[14] != '4') {
        return false;
    }
    const char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(value[19])));
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

}  // namespace archivist::core
