#pragma once

#include <memory>

#include "archivist/core/config.h"
#include "archivist/http/router.h"

namespace archivist::catalog {
class ArchiveCatalog;
}

namespace archivist::http {

/// Registers the server's buffered HTTP routes into the provided router. The upload routes
/// stream their bodies and are handled by the server session directly.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<catalog::ArchiveCatalog> catalog,
                           const core::Config& config);

}  // namespace archivist::http
