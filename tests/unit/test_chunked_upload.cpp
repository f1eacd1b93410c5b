#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/sessions/chunked_upload_manager.h"
#include "archivist/sessions/directory_session_store.h"
#include "archivist/sessions/session_sweeper.h"

using archivist::core::ErrorCode;
using archivist::core::Result;
using archivist::sessions::ChunkedUploadManager;
using archivist::sessions::DirectorySessionStore;
using archivist::storage::ArchiveFile;
using archivist::storage::ArchiveStorage;

namespace {

const std::string kSessionId = "3f2b8c1e-9a4d-4e6f-8b7a-1c2d3e4f5a6b";

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct Harness {
    explicit Harness(archivist::core::IngestConfig config = {})
        : root(std::filesystem::temp_directory_path() /
               ("archivist_chunks_" + Poco::UUIDGenerator().createOne().toString())),
          store(std::make_shared<DirectorySessionStore>((root / "chunks").string())),
          storage(std::make_shared<ArchiveStorage>((root / "archives").string(),
                                                   (root / "tmp").string())),
          manager(ioc, store, storage, config) {}

    ~Harness() { std::filesystem::remove_all(root); }

    Result<std::uint64_t> Submit(int index, int total, const std::string& data,
                                 const std::string& filename = "scan.a3d",
                                 const std::string& session_id = kSessionId) {
        auto request = manager.ParseChunkRequest(session_id, std::to_string(index),
                                                 std::to_string(total), filename);
        if (!request.ok()) {
            return request.error();
        }
        auto writer = manager.BeginChunk(request.value());
        if (!writer.ok()) {
            return writer.error();
        }
        auto written = writer.value()->Write(data);
        if (!written.ok()) {
            return written.error();
        }
        return writer.value()->Commit();
    }

    Result<ArchiveFile> Complete(const std::string& session_id = kSessionId) {
        std::optional<Result<ArchiveFile>> outcome;
        manager.Complete(session_id, [&outcome](Result<ArchiveFile> result) {
            outcome.emplace(std::move(result));
        });
        // Completion is always delivered through the io_context.
        EXPECT_FALSE(outcome.has_value());
        ioc.restart();
        ioc.run();
        if (!outcome) {
            return archivist::core::Error{ErrorCode::kInternal, "handler not invoked"};
        }
        return *outcome;
    }

    std::filesystem::path root;
    boost::asio::io_context ioc;
    std::shared_ptr<DirectorySessionStore> store;
    std::shared_ptr<ArchiveStorage> storage;
    ChunkedUploadManager manager;
};

}  // namespace

TEST(ChunkedUpload, AssemblesChunksInIndexOrder) {
    Harness h;
    ASSERT_TRUE(h.Submit(0, 3, std::string(10, 'a')).ok());
    ASSERT_TRUE(h.Submit(1, 3, std::string(10, 'b')).ok());
    ASSERT_TRUE(h.Submit(2, 3, std::string(5, 'c')).ok());

    auto placed = h.Complete();
    ASSERT_TRUE(placed.ok()) << placed.error().message;
    EXPECT_EQ(placed.value().filename, "scan.a3d");
    EXPECT_EQ(placed.value().size_bytes, 25u);
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"),
              std::string(10, 'a') + std::string(10, 'b') + std::string(5, 'c'));
    EXPECT_FALSE(std::filesystem::exists(h.root / "chunks" / kSessionId));
}

TEST(ChunkedUpload, ArrivalOrderDoesNotMatter) {
    Harness h;
    ASSERT_TRUE(h.Submit(2, 3, "three").ok());
    ASSERT_TRUE(h.Submit(0, 3, "one").ok());
    ASSERT_TRUE(h.Submit(1, 3, "two").ok());

    auto placed = h.Complete();
    ASSERT_TRUE(placed.ok());
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"), "onetwothree");
}

TEST(ChunkedUpload, ResentChunkReplacesEarlierCopy) {
    Harness h;
    ASSERT_TRUE(h.Submit(0, 2, "first").ok());
    ASSERT_TRUE(h.Submit(1, 2, "stale").ok());
    ASSERT_TRUE(h.Submit(1, 2, "fresh").ok());

    auto placed = h.Complete();
    ASSERT_TRUE(placed.ok());
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"), "firstfresh");
}

TEST(ChunkedUpload, IdenticalResendAssemblesSameBytes) {
    Harness once;
    ASSERT_TRUE(once.Submit(0, 2, "alpha").ok());
    ASSERT_TRUE(once.Submit(1, 2, "omega").ok());
    ASSERT_TRUE(once.Complete().ok());

    Harness twice;
    ASSERT_TRUE(twice.Submit(0, 2, "alpha").ok());
    ASSERT_TRUE(twice.Submit(1, 2, "omega").ok());
    ASSERT_TRUE(twice.Submit(0, 2, "alpha").ok());
    auto placed = twice.Complete();
    ASSERT_TRUE(placed.ok());
    EXPECT_EQ(placed.value().size_bytes, 10u);
    EXPECT_EQ(ReadFile(twice.root / "archives" / "scan.a3d"),
              ReadFile(once.root / "archives" / "scan.a3d"));
}

TEST(ChunkedUpload, SweptSessionCannotComplete) {
    Harness h;
    ASSERT_TRUE(h.Submit(0, 2, "alpha").ok());
    const auto dir = h.root / "chunks" / kSessionId;
    std::filesystem::last_write_time(
        dir, std::filesystem::last_write_time(dir) - std::chrono::hours(25));

    archivist::sessions::SessionSweeper sweeper(h.ioc, h.store, std::chrono::seconds(3600),
                                                std::chrono::hours(24));
    EXPECT_EQ(sweeper.SweepOnce(), 1u);

    EXPECT_EQ(h.Complete().code(), ErrorCode::kNotFound);
    EXPECT_FALSE(h.storage->Exists("scan.a3d"));
}

TEST(ChunkedUpload, OversizedResendKeepsEarlierCopy) {
    archivist::core::IngestConfig config;
    config.max_chunk_bytes = 8;
    Harness h(config);
    ASSERT_TRUE(h.Submit(0, 1, "good").ok());
    auto resent = h.Submit(0, 1, "much too large");
    ASSERT_FALSE(resent.ok());
    EXPECT_EQ(resent.code(), ErrorCode::kPayloadTooLarge);
    EXPECT_FALSE(std::filesystem::exists(h.store->StagingPath(kSessionId, 0)));

    auto placed = h.Complete();
    ASSERT_TRUE(placed.ok());
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"), "good");
}

TEST(ChunkedUpload, MissingChunkLeavesSessionIntact) {
    Harness h;
    ASSERT_TRUE(h.Submit(0, 3, "a").ok());
    ASSERT_TRUE(h.Submit(2, 3, "c").ok());

    auto placed = h.Complete();
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.code(), ErrorCode::kIncomplete);
    EXPECT_NE(placed.error().message.find("missing chunk 1"), std::string::npos);
    EXPECT_TRUE(h.store->Get(kSessionId).ok());
    EXPECT_FALSE(h.storage->Exists("scan.a3d"));

    // The client may retry the missing chunk and complete again.
    ASSERT_TRUE(h.Submit(1, 3, "b").ok());
    auto retried = h.Complete();
    ASSERT_TRUE(retried.ok());
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"), "abc");
}

TEST(ChunkedUpload, UnknownSessionIsNotFound) {
    Harness h;
    EXPECT_EQ(h.Complete().code(), ErrorCode::kNotFound);
    EXPECT_EQ(h.Complete("not-a-uuid").code(), ErrorCode::kNotFound);
}

TEST(ChunkedUpload, ExistingArchiveConflicts) {
    Harness h;
    {
        std::ofstream out(h.root / "archives" / "scan.a3d", std::ios::binary);
        out << "original";
    }
    ASSERT_TRUE(h.Submit(0, 1, "replacement").ok());

    auto placed = h.Complete();
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.code(), ErrorCode::kAlreadyExists);
    EXPECT_EQ(ReadFile(h.root / "archives" / "scan.a3d"), "original");
}

TEST(ChunkedUpload, SessionByteCeilingRejectsAssembly) {
    archivist::core::IngestConfig config;
    config.max_session_bytes = 10;
    Harness h(config);
    ASSERT_TRUE(h.Submit(0, 2, "123456").ok());
    ASSERT_TRUE(h.Submit(1, 2, "789012").ok());
    EXPECT_EQ(h.Complete().code(), ErrorCode::kPayloadTooLarge);
    EXPECT_FALSE(h.storage->Exists("scan.a3d"));
}

TEST(ChunkedUpload, RejectsIndexOutsideStoredSession) {
    Harness h;
    ASSERT_TRUE(h.Submit(0, 2, "a").ok());
    auto outside = h.Submit(2, 3, "c");
    ASSERT_FALSE(outside.ok());
    EXPECT_EQ(outside.code(), ErrorCode::kInvalidArgument);
}

TEST(ChunkedUpload, ValidatesQueryParameters) {
    Harness h;
    const auto& m = h.manager;
    EXPECT_EQ(m.ParseChunkRequest("abc", "0", "1", "a.a3d").code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "0", "1", "").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "x", "1", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "-1", "1", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "+1", "2", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, " 1", "2", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "0", " +2", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "0", "0", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "0", "201", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(m.ParseChunkRequest(kSessionId, "3", "3", "a.a3d").code(),
              ErrorCode::kInvalidArgument);
    // Version 1 UUID.
    EXPECT_EQ(m.ParseChunkRequest("3f2b8c1e-9a4d-1e6f-8b7a-1c2d3e4f5a6b", "0", "1", "a.a3d")
                  .code(),
              ErrorCode::kInvalidArgument);

    auto upper = m.ParseChunkRequest("3F2B8C1E-9A4D-4E6F-8B7A-1C2D3E4F5A6B", "199", "200",
                                     "../My Scan");
    ASSERT_TRUE(upper.ok());
    EXPECT_EQ(upper.value().session_id, kSessionId);
    EXPECT_EQ(upper.value().chunk_index, 199);
    EXPECT_EQ(upper.value().filename, "My_Scan.a3d");
}
