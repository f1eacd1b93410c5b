#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "archivist/core/result.h"

namespace archivist::sessions {

/// @brief Metadata record of one chunked upload session.
struct UploadSession {
    std::string session_id;
    /// Sanitized target filename.
    std::string filename;
    int total_chunks{0};
    std::string created_at;
};

/// @brief Persistence for chunked upload sessions and their chunk files.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// @brief Create the session if it does not exist yet. Returns the stored record, which
    /// is the existing one when the session was already created by an earlier chunk.
    virtual core::Result<UploadSession> Create(const UploadSession& session) = 0;
    /// @brief kNotFound for unknown (or swept) sessions.
    virtual core::Result<UploadSession> Get(const std::string& session_id) = 0;
    /// @brief Remove the session and all of its chunk files. Unknown ids are ignored.
    virtual core::Result<void> Delete(const std::string& session_id) = 0;
    /// @brief Ids of sessions not modified for longer than max_age.
    virtual core::Result<std::vector<std::string>> ListExpired(std::chrono::seconds max_age) = 0;

    /// @brief Final location of chunk index of a session.
    virtual std::string ChunkPath(const std::string& session_id, int index) const = 0;
    /// @brief Where a chunk is written while its request body is still arriving.
    virtual std::string StagingPath(const std::string& session_id, int index) const = 0;
};

}  // namespace archivist::sessions
