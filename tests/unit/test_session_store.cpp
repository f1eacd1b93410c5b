#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/sessions/directory_session_store.h"

using archivist::core::ErrorCode;
using archivist::sessions::DirectorySessionStore;
using archivist::sessions::UploadSession;

namespace {

std::filesystem::path MakeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("archivist_sessions_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

UploadSession MakeSession(const std::string& id, const std::string& filename, int total) {
    UploadSession session;
    session.session_id = id;
    session.filename = filename;
    session.total_chunks = total;
    session.created_at = "2026-01-01T00:00:00Z";
    return session;
}

const std::string kSessionId = "3f2b8c1e-9a4d-4e6f-8b7a-1c2d3e4f5a6b";

}  // namespace

TEST(SessionStore, CreateThenGet) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());

    auto created = store.Create(MakeSession(kSessionId, "scan.a3d", 3));
    ASSERT_TRUE(created.ok());
    auto fetched = store.Get(kSessionId);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched.value().filename, "scan.a3d");
    EXPECT_EQ(fetched.value().total_chunks, 3);
    EXPECT_EQ(fetched.value().created_at, "2026-01-01T00:00:00Z");

    std::filesystem::remove_all(root);
}

TEST(SessionStore, FirstChunkFixesSessionParameters) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());

    ASSERT_TRUE(store.Create(MakeSession(kSessionId, "scan.a3d", 3)).ok());
    auto second = store.Create(MakeSession(kSessionId, "other.a3d", 5));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().filename, "scan.a3d");
    EXPECT_EQ(second.value().total_chunks, 3);

    std::filesystem::remove_all(root);
}

TEST(SessionStore, UnknownSessionIsNotFound) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());
    EXPECT_EQ(store.Get(kSessionId).code(), ErrorCode::kNotFound);
    EXPECT_TRUE(store.Delete(kSessionId).ok());
    std::filesystem::remove_all(root);
}

TEST(SessionStore, CorruptRecordIsIoError) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());
    std::filesystem::create_directories(root / kSessionId);
    {
        std::ofstream out(root / kSessionId / "session.json");
        out << "{\"filename\": 3";
    }
    EXPECT_EQ(store.Get(kSessionId).code(), ErrorCode::kIoError);
    std::filesystem::remove_all(root);
}

TEST(SessionStore, DeleteRemovesChunks) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());
    ASSERT_TRUE(store.Create(MakeSession(kSessionId, "scan.a3d", 2)).ok());
    {
        std::ofstream out(store.ChunkPath(kSessionId, 0), std::ios::binary);
        out << "chunk";
    }
    ASSERT_TRUE(store.Delete(kSessionId).ok());
    EXPECT_FALSE(std::filesystem::exists(root / kSessionId));
    std::filesystem::remove_all(root);
}

TEST(SessionStore, ListsOnlyExpiredSessions) {
    const auto root = MakeTempDir();
    DirectorySessionStore store(root.string());
    const std::string fresh = "0b1c2d3e-4f50-4a6b-9c7d-8e9fa0b1c2d3";
    ASSERT_TRUE(store.Create(MakeSession(kSessionId, "old.a3d", 1)).ok());
    ASSERT_TRUE(store.Create(MakeSession(fresh, "new.a3d", 1)).ok());

    const auto old_dir = root / kSessionId;
    std::filesystem::last_write_time(
        old_dir, std::filesystem::last_write_time(old_dir) - std::chrono::hours(48));

    auto expired = store.ListExpired(std::chrono::hours(24));
    ASSERT_TRUE(expired.ok());
    ASSERT_EQ(expired.value().size(), 1u);
    EXPECT_EQ(expired.value()[0], kSessionId);

    std::filesystem::remove_all(root);
}
