#include "archivist/http/route_registration.h"

#include <filesystem>
#include <string>
#include <system_error>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "archivist/catalog/archive_catalog.h"
#include "archivist/http/responses.h"
#include "archivist/observability/metrics.h"

namespace archivist::http {
namespace {

HttpResponse JsonOk(int version, const std::string& body) {
    return JsonResponse(boost::beast::http::status::ok, version, body);
}

core::Result<std::string> ParseRenameBody(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj || !obj->has("filename")) {
            return core::Error{core::ErrorCode::kInvalidArgument, "filename is required"};
        }
        auto filename = obj->getValue<std::string>("filename");
        if (filename.empty()) {
            return core::Error{core::ErrorCode::kInvalidArgument, "filename is required"};
        }
        return filename;
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.what()};
    }
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<catalog::ArchiveCatalog> catalog,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [archive_path = config.storage.archive_path](
                   const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   std::error_code ec;
                   if (!std::filesystem::is_directory(archive_path, ec)) {
                       return ErrorResponse(boost::beast::http::status::service_unavailable,
                                            req.version(), "NOT_READY",
                                            "archive directory unavailable", ctx.request_id);
                   }
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("GET", "/api/archives",
               [catalog](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   auto listing = catalog->List();
                   if (!listing.ok()) {
                       return ErrorResponse(req.version(), listing.error(), ctx.request_id);
                   }
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& record : listing.value().archives) {
                       arr->add(record.ToJson());
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("archives", arr);
                   root->set("storageUsed", listing.value().storage_used);
                   return JsonResponse(boost::beast::http::status::ok, req.version(), root);
               });

    router.Add("DELETE", "/api/archives/{key}",
               [catalog](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto deleted = catalog->Delete(params.at("key"));
                   if (!deleted.ok()) {
                       return ErrorResponse(req.version(), deleted.error(), ctx.request_id);
                   }
                   return JsonOk(req.version(), "{\"deleted\":true}");
               });

    router.Add("PATCH", "/api/archives/{key}",
               [catalog](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams& params) {
                   auto filename = ParseRenameBody(req.body());
                   if (!filename.ok()) {
                       return ErrorResponse(req.version(), filename.error(), ctx.request_id);
                   }
                   auto renamed = catalog->Rename(params.at("key"), filename.value());
                   if (!renamed.ok()) {
                       return ErrorResponse(req.version(), renamed.error(), ctx.request_id);
                   }
                   return JsonResponse(boost::beast::http::status::ok, req.version(),
                                       renamed.value().ToJson());
               });
}

}  // namespace archivist::http
