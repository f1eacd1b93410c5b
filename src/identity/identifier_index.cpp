#include "archivist/identity/identifier_index.h"

#include "archivist/identity/file_identifier_index.h"
#include "archivist/identity/sqlite_identifier_index.h"

namespace archivist::identity {

std::shared_ptr<IdentifierIndex> MakeIdentifierIndex(const core::IdentifierConfig& config) {
    if (config.backend == "sqlite") {
        return std::make_shared<SqliteIdentifierIndex>(config.path);
    }
    return std::make_shared<FileIdentifierIndex>(config.path);
}

}  // namespace archivist::identity
