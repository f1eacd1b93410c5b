#include "archivist/http/http_server.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <Poco/Exception.h>
#include <Poco/URI.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "archivist/core/ids.h"
#include "archivist/core/logger.h"
#include "archivist/http/responses.h"
#include "archivist/observability/metrics.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kArchivesPath = "/api/archives";
constexpr const char* kChunksPath = "/api/archives/chunks";
constexpr const char* kCompletePattern = "/api/archives/chunks/{session_id}/complete";

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

// Query parameter value, percent-decoded.
std::string GetQueryParam(const std::string& target, const std::string& key) {
    try {
        const Poco::URI uri(target);
        for (const auto& param : uri.getQueryParameters()) {
            if (param.first == key) {
                return param.second;
            }
        }
    } catch (const Poco::Exception& ex) {
        archivist::core::LogDebug("unparsable request target " + target + ": " +
                                  ex.displayText());
    }
    return "";
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, archivist::http::Router router, archivist::core::Config config,
            std::shared_ptr<archivist::ingest::IngestService> ingest)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          ingest_(std::move(ingest)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            archivist::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        parser_.emplace();
        // Beast checks Content-Length against the limit as soon as the header is complete;
        // the limit for buffered routes is applied once the route is known.
        UnlimitBody();
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            archivist::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = archivist::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        const auto path = StripQuery(request_target_);
        const auto method = parser_->get().method();

        // Fast-path: upload bodies are streamed to disk instead of being buffered.
        if (method == http::verb::post && path == kArchivesPath) {
            return StartArchiveUpload();
        }
        if (method == http::verb::post && path == kChunksPath) {
            return StartChunkUpload();
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    void ReadBodyToString() {
        body_.clear();
        const auto declared = DeclaredLength();
        if (declared && *declared > config_.server.limits.max_body_bytes) {
            return SendError(archivist::core::Error{archivist::core::ErrorCode::kPayloadTooLarge,
                                                    "request body too large"},
                             true);
        }
        if (declared && *declared == 0) {
            return HandleRequest();
        }
        parser_->body_limit(config_.server.limits.max_body_bytes);
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return SendError(archivist::core::Error{archivist::core::ErrorCode::kPayloadTooLarge,
                                                    "request body too large"},
                             true);
        }
        if (ec && ec != http::error::need_buffer) {
            archivist::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        archivist::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name(), field.value());
        }
        request.body() = body_;
        request.prepare_payload();

        archivist::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = std::string(request.method_string());
        ctx.target = std::string(request.target());
        ctx.remote = request_remote_;

        const auto path = StripQuery(std::string(request.target()));
        archivist::http::RouteParams params;
        if (request.method() == http::verb::post &&
            archivist::http::Router::Match(kCompletePattern, path, &params)) {
            return CompleteSession(params["session_id"]);
        }

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            auto response = archivist::http::ErrorResponse(request.version(), result.error(),
                                                           request_id_);
            return Send(std::move(response));
        }
        Send(std::move(result.value()));
    }

    std::optional<std::uint64_t> DeclaredLength() {
        if (!parser_->content_length()) {
            return std::nullopt;
        }
        return parser_->content_length().value();
    }

    void UnlimitBody() {
        // Upload paths enforce their own ceilings while streaming.
        parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    void StartArchiveUpload() {
        const auto content_type = parser_->get()[http::field::content_type];
        auto begun = ingest_->BeginUpload(
            std::string_view(content_type.data(), content_type.size()), DeclaredLength());
        if (!begun.ok()) {
            return SendError(begun.error(), true);
        }
        upload_ = std::move(begun.value());
        if (parser_->is_done()) {
            return FinishArchiveUpload();
        }
        DoReadUploadChunk();
    }

    void DoReadUploadChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnUploadChunk,
                                                   this->shared_from_this()));
    }

    void OnUploadChunk(beast::error_code ec, std::size_t) {
        if (ec && ec != http::error::need_buffer) {
            // Client went away; dropping the upload removes its partial file.
            archivist::core::LogWarning("Read upload failed: " + ec.message());
            upload_.reset();
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        if (bytes > 0) {
            auto consumed = upload_->Consume(std::string_view(body_buffer_.data(), bytes));
            if (!consumed.ok()) {
                upload_.reset();
                if (consumed.code() == archivist::core::ErrorCode::kPayloadTooLarge) {
                    archivist::observability::RecordUploadRejected();
                }
                return SendError(consumed.error(), true);
            }
        }

        if (parser_->is_done()) {
            return FinishArchiveUpload();
        }
        DoReadUploadChunk();
    }

    void FinishArchiveUpload() {
        auto finished = upload_->Finish();
        upload_.reset();
        if (!finished.ok()) {
            return SendError(finished.error(), false);
        }
        ingest_->FinishUpload(std::move(finished.value()), StoredHandler());
    }

    void StartChunkUpload() {
        auto* chunks = ingest_->chunks();
        if (chunks == nullptr) {
            return SendError(archivist::core::Error{archivist::core::ErrorCode::kNotFound,
                                                    "chunked uploads are disabled"},
                             true);
        }
        auto request = chunks->ParseChunkRequest(GetQueryParam(request_target_, "sessionId"),
                                                 GetQueryParam(request_target_, "chunkIndex"),
                                                 GetQueryParam(request_target_, "totalChunks"),
                                                 GetQueryParam(request_target_, "filename"));
        if (!request.ok()) {
            return SendError(request.error(), true);
        }
        const auto declared = DeclaredLength();
        if (declared && *declared > chunks->config().max_chunk_bytes) {
            return SendError(archivist::core::Error{archivist::core::ErrorCode::kPayloadTooLarge,
                                                    "chunk exceeds " +
                                                        std::to_string(
                                                            chunks->config().max_chunk_bytes) +
                                                        " bytes"},
                             true);
        }
        auto writer = chunks->BeginChunk(request.value());
        if (!writer.ok()) {
            return SendError(writer.error(), true);
        }
        chunk_writer_ = std::move(writer.value());
        if (parser_->is_done()) {
            return FinishChunkUpload();
        }
        DoReadChunkBody();
    }

    void DoReadChunkBody() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnChunkBody,
                                                   this->shared_from_this()));
    }

    void OnChunkBody(beast::error_code ec, std::size_t) {
        if (ec && ec != http::error::need_buffer) {
            archivist::core::LogWarning("Read chunk failed: " + ec.message());
            chunk_writer_.reset();
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        if (bytes > 0) {
            auto written = chunk_writer_->Write(std::string_view(body_buffer_.data(), bytes));
            if (!written.ok()) {
                chunk_writer_.reset();
                if (written.code() == archivist::core::ErrorCode::kPayloadTooLarge) {
                    archivist::observability::RecordUploadRejected();
                }
                return SendError(written.error(), true);
            }
        }
        if (parser_->is_done()) {
            return FinishChunkUpload();
        }
        DoReadChunkBody();
    }

    void FinishChunkUpload() {
        const auto index = chunk_writer_->chunk_index();
        auto committed = chunk_writer_->Commit();
        chunk_writer_.reset();
        if (!committed.ok()) {
            return SendError(committed.error(), false);
        }
        archivist::observability::RecordChunk(committed.value());
        auto response = archivist::http::JsonResponse(
            http::status::ok, parser_->get().version(),
            "{\"received\":true,\"chunkIndex\":" + std::to_string(index) + "}");
        Send(std::move(response));
    }

    void CompleteSession(const std::string& session_id) {
        ingest_->CompleteSession(session_id, StoredHandler());
    }

    archivist::ingest::IngestService::StoredHandler StoredHandler() {
        return [self = this->shared_from_this()](
                   archivist::core::Result<archivist::catalog::ArchiveRecord> stored) {
            self->OnStored(std::move(stored));
        };
    }

    void OnStored(archivist::core::Result<archivist::catalog::ArchiveRecord> stored) {
        if (!stored.ok()) {
            return SendError(stored.error(), false);
        }
        auto response = archivist::http::JsonResponse(
            http::status::created, parser_->get().version(), stored.value().ToJson());
        Send(std::move(response));
    }

    void SendError(const archivist::core::Error& error, bool close) {
        auto response =
            archivist::http::ErrorResponse(parser_->get().version(), error, request_id_);
        if (close) {
            // The rest of the request body was never read.
            response.keep_alive(false);
        }
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "Archivist");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        archivist::core::LogRequest(request_id_, request_method_, request_target_,
                                    request_remote_, response.result_int(), latency);
        archivist::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            archivist::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    archivist::http::Router router_;
    archivist::core::Config config_;
    std::shared_ptr<archivist::ingest::IngestService> ingest_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;

    std::unique_ptr<archivist::ingest::MultipartUpload> upload_;
    std::unique_ptr<archivist::sessions::ChunkWriter> chunk_writer_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, archivist::http::Router router,
             archivist::core::Config config,
             std::shared_ptr<archivist::ingest::IngestService> ingest,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          ingest_(std::move(ingest)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            archivist::core::LogError("Listener open failed: " + ec.message());
            return;
        }
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        acceptor_.bind(endpoint, ec);
        if (ec) {
            archivist::core::LogError("Listener bind failed: " + ec.message());
            return;
        }
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            archivist::core::LogError("Listener listen failed: " + ec.message());
        }
    }

    void Run() {
        if (!acceptor_.is_open()) {
            return;
        }
        DoAccept();
    }

private:
    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            archivist::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, ingest_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             ingest_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    archivist::http::Router router_;
    archivist::core::Config config_;
    std::shared_ptr<archivist::ingest::IngestService> ingest_;
    net::ssl::context* ssl_ctx_{nullptr};
};

}  // namespace

namespace archivist::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<ingest::IngestService> ingest,
                       std::shared_ptr<sessions::SessionStore> session_store)
    : ioc_(ioc), config_(config), router_(std::move(router)), ingest_(std::move(ingest)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
    if (config_.ingest.chunked_enabled && session_store) {
        sweeper_ = std::make_unique<sessions::SessionSweeper>(
            ioc_, std::move(session_store),
            std::chrono::seconds(config_.ingest.sweep_interval_seconds),
            std::chrono::seconds(config_.ingest.session_retention_seconds));
    }
}

void HttpServer::Run() {
    if (sweeper_) {
        sweeper_->Start();
    }

    const auto address = net::ip::make_address(config_.server.host);
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    std::make_shared<Listener>(ioc_, endpoint, router_, config_, ingest_,
                               ssl_context_ ? ssl_context_.get() : nullptr)
        ->Run();
}

void HttpServer::Stop() {
    if (sweeper_) {
        sweeper_->Stop();
    }
}

}  // namespace archivist::http
