#include "archivist/identity/content_address.h"

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

namespace archivist::identity {

std::string ArchiveHash(const std::string& logical_path) {
    Poco::SHA2Engine256 sha256;
    sha256.update(logical_path);
    return Poco::DigestEngine::digestToHex(sha256.digest()).substr(0, kArchiveHashLength);
}

std::string LogicalPath(const std::string& url_prefix, const std::string& filename) {
    return url_prefix + filename;
}

}  // namespace archivist::identity
