#include "archivist/http/responses.h"

#include <sstream>

namespace archivist::http {

using boost::beast::http::status;

boost::beast::http::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return status::ok;
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kIncomplete:
            return status::bad_request;
        case core::ErrorCode::kNotFound:
            return status::not_found;
        case core::ErrorCode::kAlreadyExists:
            return status::conflict;
        case core::ErrorCode::kPayloadTooLarge:
            return status::payload_too_large;
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kDbError:
        case core::ErrorCode::kInternal:
            break;
    }
    return status::internal_server_error;
}

const char* ErrorCodeName(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return "OK";
        case core::ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case core::ErrorCode::kNotFound:
            return "NOT_FOUND";
        case core::ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case core::ErrorCode::kPayloadTooLarge:
            return "PAYLOAD_TOO_LARGE";
        case core::ErrorCode::kIncomplete:
            return "INCOMPLETE";
        case core::ErrorCode::kIoError:
            return "IO_ERROR";
        case core::ErrorCode::kDbError:
            return "DB_ERROR";
        case core::ErrorCode::kInternal:
            break;
    }
    return "INTERNAL";
}

HttpResponse JsonResponse(boost::beast::http::status code, int version,
                          const std::string& body) {
    HttpResponse response{code, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonResponse(boost::beast::http::status code, int version,
                          const Poco::JSON::Object::Ptr& body) {
    std::stringstream ss;
    body->stringify(ss);
    return JsonResponse(code, version, ss.str());
}

HttpResponse ErrorResponse(boost::beast::http::status code, int version,
                           const std::string& error_code, const std::string& message,
                           const std::string& request_id) {
    // Messages may quote client input, so the envelope is built with the JSON writer.
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", error_code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);
    return JsonResponse(code, version, root);
}

HttpResponse ErrorResponse(int version, const core::Error& error,
                           const std::string& request_id) {
    return ErrorResponse(StatusFor(error.code), version, ErrorCodeName(error.code), error.message,
                         request_id);
}

}  // namespace archivist::http
