#include "archivist/sessions/directory_session_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <Poco/File.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Timestamp.h>

#include "archivist/core/logger.h"

namespace archivist::sessions {

namespace {
constexpr const char* kRecordName = "session.json";
}

DirectorySessionStore::DirectorySessionStore(std::string root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

core::Result<UploadSession> DirectorySessionStore::Create(const UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = ReadRecord(session.session_id);
    if (existing.ok() || existing.code() != core::ErrorCode::kNotFound) {
        // The first chunk fixes filename and totalChunks for the whole session.
        return existing;
    }

    std::error_code ec;
    std::filesystem::create_directories(SessionDir(session.session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to create session directory: " + ec.message()};
    }

    Poco::JSON::Object record;
    record.set("filename", session.filename);
    record.set("totalChunks", session.total_chunks);
    record.set("createdAt", session.created_at);

    const auto record_path = RecordPath(session.session_id);
    const auto temp_path = record_path + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError, "failed to write session record"};
        }
        record.stringify(out);
        out.flush();
        if (!out) {
            return core::Error{core::ErrorCode::kIoError, "failed to write session record"};
        }
    }
    std::filesystem::rename(temp_path, record_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return core::Error{core::ErrorCode::kIoError, "failed to write session record"};
    }
    return session;
}

core::Result<UploadSession> DirectorySessionStore::Get(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadRecord(session_id);
}

core::Result<void> DirectorySessionStore::Delete(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove_all(SessionDir(session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to delete session " + session_id + ": " + ec.message()};
    }
    return core::Ok();
}

core::Result<std::vector<std::string>> DirectorySessionStore::ListExpired(
    std::chrono::seconds max_age) {
    std::vector<std::string> expired;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to list sessions: " + ec.message()};
    }

    const Poco::Timestamp::TimeDiff max_age_us =
        static_cast<Poco::Timestamp::TimeDiff>(max_age.count()) * Poco::Timestamp::resolution();
    for (const auto& entry : it) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        try {
            Poco::File dir(entry.path().string());
            if (dir.getLastModified().isElapsed(max_age_us)) {
                expired.push_back(entry.path().filename().string());
            }
        } catch (const Poco::Exception& ex) {
            // Vanished between listing and stat, most likely completed meanwhile.
            core::LogDebug("skipping session entry " + entry.path().string() + ": " +
                           ex.displayText());
        }
    }
    return expired;
}

std::string DirectorySessionStore::ChunkPath(const std::string& session_id, int index) const {
    return (std::filesystem::path(SessionDir(session_id)) / std::to_string(index)).string();
}

std::string DirectorySessionStore::StagingPath(const std::string& session_id, int index) const {
    return (std::filesystem::path(SessionDir(session_id)) / (std::to_string(index) + ".part"))
        .string();
}

std::string DirectorySessionStore::SessionDir(const std::string& session_id) const {
    return (std::filesystem::path(root_) / session_id).string();
}

std::string DirectorySessionStore::RecordPath(const std::string& session_id) const {
    return (std::filesystem::path(SessionDir(session_id)) / kRecordName).string();
}

core::Result<UploadSession> DirectorySessionStore::ReadRecord(
    const std::string& session_id) const {
    std::ifstream in(RecordPath(session_id), std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kNotFound, "upload session not found"};
    }
    std::stringstream ss;
    ss << in.rdbuf();

    try {
        Poco::JSON::Parser parser;
        auto obj = parser.parse(ss.str()).extract<Poco::JSON::Object::Ptr>();
        UploadSession session;
        session.session_id = session_id;
        session.filename = obj->getValue<std::string>("filename");
        session.total_chunks = obj->getValue<int>("totalChunks");
        session.created_at = obj->optValue<std::string>("createdAt", "");
        return session;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError,
                           "corrupt session record for " + session_id + ": " +
                               ex.displayText()};
    }
}

}  // namespace archivist::sessions
