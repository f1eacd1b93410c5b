#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "archivist/catalog/archive_catalog.h"
#include "archivist/core/config.h"
#include "archivist/core/logger.h"
#include "archivist/extract/metadata_extractor.h"
#include "archivist/http/http_server.h"
#include "archivist/http/route_registration.h"
#include "archivist/http/router.h"
#include "archivist/identity/identifier_index.h"
#include "archivist/ingest/ingest_service.h"
#include "archivist/sessions/chunked_upload_manager.h"
#include "archivist/sessions/directory_session_store.h"
#include "archivist/storage/archive_storage.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    archivist::core::Config config;
    try {
        config = archivist::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    archivist::core::InitLogging(config.observability.log_level);

    boost::asio::io_context ioc(config.server.threads);

    auto storage = std::make_shared<archivist::storage::ArchiveStorage>(
        config.storage.archive_path, config.storage.temp_path);
    auto ids = archivist::identity::MakeIdentifierIndex(config.identifiers);
    auto catalog =
        std::make_shared<archivist::catalog::ArchiveCatalog>(storage, ids, config.storage);

    std::shared_ptr<archivist::extract::MetadataExtractor> extractor;
    if (config.extractor.enabled) {
        extractor = std::make_shared<archivist::extract::ProcessMetadataExtractor>(
            ioc, config.extractor, config.storage.archive_path);
    } else {
        extractor = std::make_shared<archivist::extract::NoopMetadataExtractor>(ioc);
    }

    std::shared_ptr<archivist::sessions::SessionStore> session_store;
    std::shared_ptr<archivist::sessions::ChunkedUploadManager> chunks;
    if (config.ingest.chunked_enabled) {
        session_store =
            std::make_shared<archivist::sessions::DirectorySessionStore>(config.storage.chunk_path);
        chunks = std::make_shared<archivist::sessions::ChunkedUploadManager>(
            ioc, session_store, storage, config.ingest);
    }

    auto ingest = std::make_shared<archivist::ingest::IngestService>(
        ioc, config.ingest, storage, catalog, extractor, chunks);

    archivist::http::Router router;
    archivist::http::RegisterDefaultRoutes(router, catalog, config);

    archivist::http::HttpServer server(ioc, config, std::move(router), ingest, session_store);
    server.Run();
    archivist::core::LogInfo("Archivist listening on " + config.server.host + ":" +
                             std::to_string(config.server.port));

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc, &server](const boost::system::error_code&, int) {
        archivist::core::LogInfo("Shutting down");
        server.Stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
