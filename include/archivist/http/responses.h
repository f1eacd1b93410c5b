#pragma once

#include <string>

#include <Poco/JSON/Object.h>

#include "archivist/core/error.h"
#include "archivist/http/router.h"

namespace archivist::http {

/// @brief HTTP status for an error code (400, 404, 409, 413 or 500).
boost::beast::http::status StatusFor(core::ErrorCode code);
/// @brief Stable machine-readable name, e.g. "PAYLOAD_TOO_LARGE".
const char* ErrorCodeName(core::ErrorCode code);

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body);
HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const Poco::JSON::Object::Ptr& body);

/// @brief Consistent error envelope: {"error":{"code","message","request_id"}}.
HttpResponse ErrorResponse(boost::beast::http::status status, int version,
                           const std::string& code, const std::string& message,
                           const std::string& request_id);
HttpResponse ErrorResponse(int version, const core::Error& error,
                           const std::string& request_id);

}  // namespace archivist::http
