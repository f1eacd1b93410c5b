#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/ingest/multipart_upload.h"

using archivist::core::ErrorCode;
using archivist::ingest::MultipartUpload;

namespace {

std::filesystem::path MakeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("archivist_upload_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

std::string Body(const std::string& payload) {
    return "--b0\r\nContent-Disposition: form-data; name=\"file\"; filename=\"scan.a3d\"\r\n\r\n" +
           payload + "\r\n--b0--\r\n";
}

bool IsEmptyDir(const std::filesystem::path& dir) {
    return std::filesystem::directory_iterator(dir) == std::filesystem::directory_iterator();
}

}  // namespace

TEST(MultipartUpload, RejectsNonMultipartContentType) {
    auto upload = MultipartUpload::Begin("application/octet-stream", "/tmp/unused", 1024);
    ASSERT_FALSE(upload.ok());
    EXPECT_EQ(upload.code(), ErrorCode::kInvalidArgument);
}

TEST(MultipartUpload, WritesFilePartToTempFile) {
    const auto dir = MakeTempDir();
    auto upload = MultipartUpload::Begin("multipart/form-data; boundary=b0",
                                         (dir / "upload").string(), 1 << 20);
    ASSERT_TRUE(upload.ok());

    const auto body = Body("archive bytes");
    ASSERT_TRUE(upload.value()->Consume(body.substr(0, 30)).ok());
    ASSERT_TRUE(upload.value()->Consume(body.substr(30)).ok());
    auto finished = upload.value()->Finish();
    ASSERT_TRUE(finished.ok());
    EXPECT_EQ(finished.value().filename, "scan.a3d");
    EXPECT_EQ(finished.value().size_bytes, 13u);

    std::ifstream in(finished.value().temp_path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "archive bytes");

    std::filesystem::remove_all(dir);
}

TEST(MultipartUpload, LeavesNoFileWhenLimitExceeded) {
    const auto dir = MakeTempDir();
    auto upload = MultipartUpload::Begin("multipart/form-data; boundary=b0",
                                         (dir / "upload").string(), 128);
    ASSERT_TRUE(upload.ok());

    const auto body = Body(std::string(1000, 'x'));
    ASSERT_TRUE(upload.value()->Consume(body.substr(0, 100)).ok());
    auto consumed = upload.value()->Consume(body.substr(100));
    ASSERT_FALSE(consumed.ok());
    EXPECT_EQ(consumed.code(), ErrorCode::kPayloadTooLarge);
    EXPECT_TRUE(IsEmptyDir(dir));

    std::filesystem::remove_all(dir);
}

TEST(MultipartUpload, DestroyingUnfinishedUploadRemovesPartialFile) {
    const auto dir = MakeTempDir();
    {
        auto upload = MultipartUpload::Begin("multipart/form-data; boundary=b0",
                                             (dir / "upload").string(), 1 << 20);
        ASSERT_TRUE(upload.ok());
        const auto body = Body(std::string(4096, 'x'));
        ASSERT_TRUE(upload.value()->Consume(body.substr(0, 2048)).ok());
        EXPECT_FALSE(IsEmptyDir(dir));
    }
    EXPECT_TRUE(IsEmptyDir(dir));

    std::filesystem::remove_all(dir);
}

TEST(MultipartUpload, FailsWithoutFilePart) {
    const auto dir = MakeTempDir();
    auto upload = MultipartUpload::Begin("multipart/form-data; boundary=b0",
                                         (dir / "upload").string(), 1 << 20);
    ASSERT_TRUE(upload.ok());
    ASSERT_TRUE(upload.value()->Consume("preamble only").ok());
    auto finished = upload.value()->Finish();
    ASSERT_FALSE(finished.ok());
    EXPECT_EQ(finished.code(), ErrorCode::kInvalidArgument);
    EXPECT_TRUE(IsEmptyDir(dir));

    std::filesystem::remove_all(dir);
}
