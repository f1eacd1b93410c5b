#include "archivist/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace archivist::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePath(const std::string& value, const std::string& key) {
    if (IsBlank(value)) {
        throw std::invalid_argument(key + " must not be empty");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 1);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 1048576));

    config.storage.archive_path = cfg->getString("storage.archive_path", "data/archives");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");
    config.storage.chunk_path = cfg->getString("storage.chunk_path", "data/tmp/chunks");
    config.storage.meta_path = cfg->getString("storage.meta_path", "data/meta");
    config.storage.thumbs_path = cfg->getString("storage.thumbs_path", "data/thumbs");
    config.storage.url_prefix = cfg->getString("storage.url_prefix", "/archives/");

    config.ingest.max_upload_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("ingest.max_upload_bytes", 536870912));
    config.ingest.max_chunk_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("ingest.max_chunk_bytes", 1073741824));
    config.ingest.max_session_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("ingest.max_session_bytes", 0));
    config.ingest.chunked_enabled = cfg->getBool("ingest.chunked_enabled", true);
    config.ingest.max_total_chunks = cfg->getInt("ingest.max_total_chunks", 200);
    config.ingest.session_retention_seconds =
        cfg->getInt("ingest.session_retention_seconds", 86400);
    config.ingest.sweep_interval_seconds = cfg->getInt("ingest.sweep_interval_seconds", 3600);

    config.identifiers.backend = cfg->getString("identifiers.backend", "file");
    config.identifiers.path = cfg->getString("identifiers.path", "data/archive-ids.json");

    config.extractor.enabled = cfg->getBool("extractor.enabled", false);
    config.extractor.command = cfg->getString("extractor.command", "/opt/extract-meta.sh");
    config.extractor.output_root = cfg->getString("extractor.output_root", "data");
    config.extractor.timeout_seconds = cfg->getInt("extractor.timeout_seconds", 120);
    config.extractor.poll_interval_ms = cfg->getInt("extractor.poll_interval_ms", 100);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    // Sessions, sweeper and assembly steps share one loop without a strand.
    if (config.server.threads != 1) {
        throw std::invalid_argument("server.threads must be 1");
    }
    RequirePath(config.storage.archive_path, "storage.archive_path");
    RequirePath(config.storage.temp_path, "storage.temp_path");
    RequirePath(config.storage.chunk_path, "storage.chunk_path");
    RequirePath(config.identifiers.path, "identifiers.path");
    if (config.storage.url_prefix.empty() || config.storage.url_prefix.front() != '/' ||
        config.storage.url_prefix.back() != '/') {
        throw std::invalid_argument("storage.url_prefix must start and end with '/'");
    }
    if (config.ingest.max_upload_bytes == 0 || config.ingest.max_chunk_bytes == 0) {
        throw std::invalid_argument("ingest upload limits must be positive");
    }
    // The 200-chunk ceiling bounds the size of a session directory.
    if (config.ingest.max_total_chunks <= 0 || config.ingest.max_total_chunks > 200) {
        throw std::invalid_argument("ingest.max_total_chunks must be in [1, 200]");
    }
    if (config.ingest.session_retention_seconds <= 0) {
        throw std::invalid_argument("ingest.session_retention_seconds must be positive");
    }
    if (config.ingest.sweep_interval_seconds <= 0) {
        throw std::invalid_argument("ingest.sweep_interval_seconds must be positive");
    }
    if (config.identifiers.backend != "file" && config.identifiers.backend != "sqlite") {
        throw std::invalid_argument("identifiers.backend must be \"file\" or \"sqlite\"");
    }
    if (config.extractor.enabled) {
        RequirePath(config.extractor.command, "extractor.command");
        if (config.extractor.timeout_seconds <= 0 || config.extractor.poll_interval_ms <= 0) {
            throw std::invalid_argument("extractor timeouts must be positive");
        }
    }
    return config;
}

}  // namespace archivist::core
