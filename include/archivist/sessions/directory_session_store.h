#pragma once

#include <mutex>
#include <string>

#include "archivist/sessions/session_store.h"

namespace archivist::sessions {

/// @brief One directory per session under root:
///
///     <root>/<session id>/session.json   {"filename", "totalChunks", "createdAt"}
///     <root>/<session id>/<index>        chunk files
///     <root>/<session id>/<index>.part   chunk being received
///
/// Expiry is judged on the session directory's modification time, which every chunk
/// arrival refreshes.
class DirectorySessionStore : public SessionStore {
public:
    explicit DirectorySessionStore(std::string root);

    core::Result<UploadSession> Create(const UploadSession& session) override;
    core::Result<UploadSession> Get(const std::string& session_id) override;
    core::Result<void> Delete(const std::string& session_id) override;
    core::Result<std::vector<std::string>> ListExpired(std::chrono::seconds max_age) override;

    std::string ChunkPath(const std::string& session_id, int index) const override;
    std::string StagingPath(const std::string& session_id, int index) const override;

    const std::string& root() const { return root_; }

private:
    std::string SessionDir(const std::string& session_id) const;
    std::string RecordPath(const std::string& session_id) const;
    core::Result<UploadSession> ReadRecord(const std::string& session_id) const;

    std::string root_;
    std::mutex mutex_;
};

}  // namespace archivist::sessions
