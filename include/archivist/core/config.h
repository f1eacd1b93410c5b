#pragma once

#include <cstdint>
#include <string>

namespace archivist::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Limits for requests that are buffered in memory (everything except uploads).
struct LimitsConfig {
    std::uint64_t max_body_bytes{1048576};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{1};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief On-disk layout: archive collection, temp space, chunk sessions and sidecars.
struct StorageConfig {
    std::string archive_path{"data/archives"};
    std::string temp_path{"data/tmp"};
    std::string chunk_path{"data/tmp/chunks"};
    std::string meta_path{"data/meta"};
    std::string thumbs_path{"data/thumbs"};
    std::string url_prefix{"/archives/"};
};

/// @brief Upload limits and chunked-session policy.
struct IngestConfig {
    std::uint64_t max_upload_bytes{536870912};
    std::uint64_t max_chunk_bytes{1073741824};
    /// Sum of all chunk files of one session; 0 disables the check.
    std::uint64_t max_session_bytes{0};
    bool chunked_enabled{true};
    int max_total_chunks{200};
    int session_retention_seconds{86400};
    int sweep_interval_seconds{3600};
};

/// @brief Persisted archive id mapping ("file" JSON mapping or "sqlite").
struct IdentifierConfig {
    std::string backend{"file"};
    std::string path{"data/archive-ids.json"};
};

/// @brief External metadata extraction tool invoked after an archive is placed.
struct ExtractorConfig {
    bool enabled{false};
    std::string command{"/opt/extract-meta.sh"};
    std::string output_root{"data"};
    int timeout_seconds{120};
    int poll_interval_ms{100};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for Archivist.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    IngestConfig ingest;
    IdentifierConfig identifiers;
    ExtractorConfig extractor;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file. Throws std::invalid_argument on bad values.
Config LoadConfig(const std::string& path);

}  // namespace archivist::core
