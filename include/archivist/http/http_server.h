#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "archivist/core/config.h"
#include "archivist/http/router.h"
#include "archivist/ingest/ingest_service.h"
#include "archivist/sessions/session_store.h"
#include "archivist/sessions/session_sweeper.h"

namespace archivist::http {

/// @brief HTTP server bootstrapper (acceptor, TLS context, stale session sweeper).
class HttpServer {
public:
    /// @brief session_store may be null when chunked mode is disabled.
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<ingest::IngestService> ingest,
               std::shared_ptr<sessions::SessionStore> session_store);
    void Run();
    void Stop();

private:
    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<ingest::IngestService> ingest_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<sessions::SessionSweeper> sweeper_;
};

}  // namespace archivist::http
