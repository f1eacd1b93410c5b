#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace archivist::observability {

/// @brief Render Prometheus-style metrics for the `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Record an archive placed in the collection (whole-file or assembled).
void RecordArchiveStored(std::uint64_t size_bytes);
/// @brief Record one chunk accepted into a session.
void RecordChunk(std::uint64_t size_bytes);
void RecordUploadRejected();
void RecordSessionsSwept(std::size_t count);
void RecordExtractionFailure();

}  // namespace archivist::observability
