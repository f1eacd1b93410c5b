#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/storage/archive_storage.h"

using archivist::core::ErrorCode;
using archivist::storage::ArchiveStorage;

namespace {

std::filesystem::path MakeTempDir() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("archivist_storage_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary);
    out << data;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST(PathSafety, AcceptsArchiveNames) {
    EXPECT_TRUE(ArchiveStorage::IsSafeName("scan.a3d"));
    EXPECT_TRUE(ArchiveStorage::IsSafeName("scan-01_v2.a3z"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(ArchiveStorage::IsSafeName("../secret.a3d"));
    EXPECT_FALSE(ArchiveStorage::IsSafeName(".."));
    EXPECT_FALSE(ArchiveStorage::IsSafeName("a/b.a3d"));
    EXPECT_FALSE(ArchiveStorage::IsSafeName(""));
}

TEST(ArchiveStorage, PlaceMovesTempFileIntoCollection) {
    const auto root = MakeTempDir();
    ArchiveStorage storage((root / "archives").string(), (root / "tmp").string());

    const auto temp = storage.NewTempPath("upload");
    WriteFile(temp, "bytes");
    auto placed = storage.Place(temp, "scan.a3d");
    ASSERT_TRUE(placed.ok());
    EXPECT_EQ(placed.value().filename, "scan.a3d");
    EXPECT_EQ(placed.value().size_bytes, 5u);
    EXPECT_FALSE(placed.value().modified.empty());
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_EQ(ReadFile(root / "archives" / "scan.a3d"), "bytes");

    std::filesystem::remove_all(root);
}

TEST(ArchiveStorage, PlaceRefusesToOverwrite) {
    const auto root = MakeTempDir();
    ArchiveStorage storage((root / "archives").string(), (root / "tmp").string());
    WriteFile(root / "archives" / "scan.a3d", "original");

    const auto temp = storage.NewTempPath("upload");
    WriteFile(temp, "replacement");
    auto placed = storage.Place(temp, "scan.a3d");
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.code(), ErrorCode::kAlreadyExists);
    EXPECT_EQ(ReadFile(root / "archives" / "scan.a3d"), "original");
    // The rejected upload is not left behind.
    EXPECT_FALSE(std::filesystem::exists(temp));

    std::filesystem::remove_all(root);
}

TEST(ArchiveStorage, ListReturnsOnlyArchivesSortedByName) {
    const auto root = MakeTempDir();
    ArchiveStorage storage((root / "archives").string(), (root / "tmp").string());
    WriteFile(root / "archives" / "b.a3z", "12");
    WriteFile(root / "archives" / "a.a3d", "1");
    WriteFile(root / "archives" / "notes.txt", "x");
    std::filesystem::create_directories(root / "archives" / "dir.a3d");

    auto listed = storage.List();
    ASSERT_TRUE(listed.ok());
    ASSERT_EQ(listed.value().size(), 2u);
    EXPECT_EQ(listed.value()[0].filename, "a.a3d");
    EXPECT_EQ(listed.value()[1].filename, "b.a3z");
    EXPECT_EQ(listed.value()[1].size_bytes, 2u);

    std::filesystem::remove_all(root);
}

TEST(ArchiveStorage, RenameAndRemove) {
    const auto root = MakeTempDir();
    ArchiveStorage storage((root / "archives").string(), (root / "tmp").string());
    WriteFile(root / "archives" / "a.a3d", "1");
    WriteFile(root / "archives" / "b.a3d", "2");

    EXPECT_EQ(storage.Rename("a.a3d", "b.a3d").code(), ErrorCode::kAlreadyExists);
    EXPECT_EQ(storage.Rename("missing.a3d", "c.a3d").code(), ErrorCode::kNotFound);
    EXPECT_EQ(storage.Rename("a.a3d", "../c.a3d").code(), ErrorCode::kInvalidArgument);

    auto renamed = storage.Rename("a.a3d", "c.a3d");
    ASSERT_TRUE(renamed.ok());
    EXPECT_EQ(renamed.value().filename, "c.a3d");
    EXPECT_FALSE(storage.Exists("a.a3d"));

    ASSERT_TRUE(storage.Remove("c.a3d").ok());
    EXPECT_EQ(storage.Remove("c.a3d").code(), ErrorCode::kNotFound);

    std::filesystem::remove_all(root);
}

TEST(ArchiveStorage, MoveFileCreatesTargetDirectory) {
    const auto root = MakeTempDir();
    WriteFile(root / "source", "data");

    auto moved = ArchiveStorage::MoveFile((root / "source").string(),
                                          (root / "nested" / "target").string());
    ASSERT_TRUE(moved.ok());
    EXPECT_EQ(ReadFile(root / "nested" / "target"), "data");
    EXPECT_FALSE(std::filesystem::exists(root / "source"));

    std::filesystem::remove_all(root);
}
