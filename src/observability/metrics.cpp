#include "archivist/observability/metrics.h"

#include <atomic>

namespace archivist::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_archives_stored{0};
std::atomic<std::uint64_t> g_archive_bytes{0};
std::atomic<std::uint64_t> g_chunks_received{0};
std::atomic<std::uint64_t> g_chunk_bytes{0};
std::atomic<std::uint64_t> g_uploads_rejected{0};
std::atomic<std::uint64_t> g_sessions_swept{0};
std::atomic<std::uint64_t> g_extraction_failures{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n"
           "# TYPE " + name + " counter\n" +
           name + " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordArchiveStored(std::uint64_t size_bytes) {
    g_archives_stored.fetch_add(1, std::memory_order_relaxed);
    g_archive_bytes.fetch_add(size_bytes, std::memory_order_relaxed);
}

void RecordChunk(std::uint64_t size_bytes) {
    g_chunks_received.fetch_add(1, std::memory_order_relaxed);
    g_chunk_bytes.fetch_add(size_bytes, std::memory_order_relaxed);
}

void RecordUploadRejected() { g_uploads_rejected.fetch_add(1, std::memory_order_relaxed); }

void RecordSessionsSwept(std::size_t count) {
    g_sessions_swept.fetch_add(static_cast<std::uint64_t>(count), std::memory_order_relaxed);
}

void RecordExtractionFailure() {
    g_extraction_failures.fetch_add(1, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP archivist_up 1 if server is up\n"
           "# TYPE archivist_up gauge\n"
           "archivist_up 1\n" +
           Counter("archivist_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("archivist_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("archivist_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("archivist_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("archivist_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("archivist_archives_stored_total", "Archives placed in the collection",
                   g_archives_stored) +
           Counter("archivist_archive_bytes_total", "Bytes placed in the collection",
                   g_archive_bytes) +
           Counter("archivist_chunks_received_total", "Chunks accepted into sessions",
                   g_chunks_received) +
           Counter("archivist_chunk_bytes_total", "Bytes accepted as chunks", g_chunk_bytes) +
           Counter("archivist_uploads_rejected_total", "Uploads rejected for size limits",
                   g_uploads_rejected) +
           Counter("archivist_sessions_swept_total", "Stale chunk sessions deleted",
                   g_sessions_swept) +
           Counter("archivist_extraction_failures_total", "Failed metadata extractions",
                   g_extraction_failures);
}

}  // namespace archivist::observability
