#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/UUIDGenerator.h>

#include "archivist/catalog/archive_catalog.h"
#include "archivist/core/ids.h"
#include "archivist/identity/file_identifier_index.h"

using archivist::catalog::ArchiveCatalog;
using archivist::core::ErrorCode;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << data;
}

Poco::JSON::Object::Ptr ReadJson(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    Poco::JSON::Parser parser;
    return parser.parse(ss.str()).extract<Poco::JSON::Object::Ptr>();
}

struct CatalogFixture {
    CatalogFixture()
        : root(std::filesystem::temp_directory_path() /
               ("archivist_catalog_" + Poco::UUIDGenerator().createOne().toString())) {
        config.archive_path = (root / "archives").string();
        config.temp_path = (root / "tmp").string();
        config.meta_path = (root / "meta").string();
        config.thumbs_path = (root / "thumbs").string();
        config.url_prefix = "/archives/";
        storage = std::make_shared<archivist::storage::ArchiveStorage>(config.archive_path,
                                                                       config.temp_path);
        ids = std::make_shared<archivist::identity::FileIdentifierIndex>(
            (root / "ids.json").string());
        catalog = std::make_shared<ArchiveCatalog>(storage, ids, config);
    }

    ~CatalogFixture() { std::filesystem::remove_all(root); }

    std::filesystem::path root;
    archivist::core::StorageConfig config;
    std::shared_ptr<archivist::storage::ArchiveStorage> storage;
    std::shared_ptr<archivist::identity::FileIdentifierIndex> ids;
    std::shared_ptr<ArchiveCatalog> catalog;
};

}  // namespace

TEST(ArchiveCatalog, DescribesArchiveWithoutSidecar) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "test.a3d", "12345");

    auto record = f.catalog->Describe("test.a3d");
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(record.value().hash, "905b2aa9a9de2760");
    EXPECT_EQ(record.value().path, "/archives/test.a3d");
    EXPECT_EQ(record.value().title, "test");
    EXPECT_EQ(record.value().size_bytes, 5u);
    EXPECT_EQ(record.value().viewer_url, "/?archive=/archives/test.a3d");
    EXPECT_FALSE(record.value().thumbnail.has_value());
    EXPECT_TRUE(archivist::core::IsUuidV4(record.value().uuid));

    auto json = record.value().ToJson();
    EXPECT_TRUE(json->isNull("thumbnail"));
    EXPECT_EQ(json->getValue<std::string>("viewerUrl"), "/?archive=/archives/test.a3d");

    // The id is persisted and stable.
    auto again = f.catalog->Describe("test.a3d");
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().uuid, record.value().uuid);
}

TEST(ArchiveCatalog, SidecarSuppliesTitleAndThumbnail) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "scan.a3d", "x");
    WriteFile(f.root / "meta" / "6186b0e680316394.json",
              R"({"title": "Old Mill", "thumbnail": "/thumbs/6186b0e680316394.jpg"})");

    auto record = f.catalog->Describe("scan.a3d");
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(record.value().title, "Old Mill");
    ASSERT_TRUE(record.value().thumbnail.has_value());
    EXPECT_EQ(*record.value().thumbnail, "/thumbs/6186b0e680316394.jpg");
}

TEST(ArchiveCatalog, ListSumsStorage) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "a.a3d", "123");
    WriteFile(f.root / "archives" / "b.a3z", "4567");

    auto listing = f.catalog->List();
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.value().archives.size(), 2u);
    EXPECT_EQ(listing.value().storage_used, 7u);
    EXPECT_EQ(listing.value().archives[0].filename, "a.a3d");
}

TEST(ArchiveCatalog, ResolvesHashAndId) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "test.a3d", "x");
    auto record = f.catalog->Describe("test.a3d");
    ASSERT_TRUE(record.ok());

    auto by_hash = f.catalog->ResolveKey("905b2aa9a9de2760");
    ASSERT_TRUE(by_hash.ok());
    EXPECT_EQ(by_hash.value(), "test.a3d");

    auto by_id = f.catalog->ResolveKey(record.value().uuid);
    ASSERT_TRUE(by_id.ok());
    EXPECT_EQ(by_id.value(), "test.a3d");

    EXPECT_EQ(f.catalog->ResolveKey("0000000000000000").code(), ErrorCode::kNotFound);
    EXPECT_EQ(f.catalog->ResolveKey("test.a3d").code(), ErrorCode::kNotFound);
}

TEST(ArchiveCatalog, DeleteRemovesArchiveSidecarsAndId) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "test.a3d", "x");
    WriteFile(f.root / "meta" / "905b2aa9a9de2760.json", R"({"title": "T"})");
    WriteFile(f.root / "thumbs" / "905b2aa9a9de2760.jpg", "jpg");
    auto record = f.catalog->Describe("test.a3d");
    ASSERT_TRUE(record.ok());

    ASSERT_TRUE(f.catalog->Delete(record.value().uuid).ok());
    EXPECT_FALSE(std::filesystem::exists(f.root / "archives" / "test.a3d"));
    EXPECT_FALSE(std::filesystem::exists(f.root / "meta" / "905b2aa9a9de2760.json"));
    EXPECT_FALSE(std::filesystem::exists(f.root / "thumbs" / "905b2aa9a9de2760.jpg"));
    EXPECT_EQ(f.ids->Lookup("/archives/test.a3d").code(), ErrorCode::kNotFound);
    EXPECT_EQ(f.catalog->Delete("905b2aa9a9de2760").code(), ErrorCode::kNotFound);
}

TEST(ArchiveCatalog, RenameCarriesIdAndSidecars) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "test.a3d", "x");
    WriteFile(f.root / "meta" / "905b2aa9a9de2760.json",
              R"({"title": "Kept", "thumbnail": "/thumbs/905b2aa9a9de2760.jpg",)"
              R"( "archive_url": "/archives/test.a3d"})");
    WriteFile(f.root / "thumbs" / "905b2aa9a9de2760.jpg", "jpg");
    auto before = f.catalog->Describe("test.a3d");
    ASSERT_TRUE(before.ok());

    auto renamed = f.catalog->Rename("905b2aa9a9de2760", "renamed");
    ASSERT_TRUE(renamed.ok()) << renamed.error().message;
    EXPECT_EQ(renamed.value().filename, "renamed.a3d");
    EXPECT_EQ(renamed.value().hash, "6ab663b8ab47b91a");
    EXPECT_EQ(renamed.value().uuid, before.value().uuid);
    EXPECT_EQ(renamed.value().title, "Kept");
    ASSERT_TRUE(renamed.value().thumbnail.has_value());
    EXPECT_EQ(*renamed.value().thumbnail, "/thumbs/6ab663b8ab47b91a.jpg");

    EXPECT_TRUE(std::filesystem::exists(f.root / "thumbs" / "6ab663b8ab47b91a.jpg"));
    EXPECT_FALSE(std::filesystem::exists(f.root / "meta" / "905b2aa9a9de2760.json"));
    auto meta = ReadJson(f.root / "meta" / "6ab663b8ab47b91a.json");
    EXPECT_EQ(meta->getValue<std::string>("archive_url"), "/archives/renamed.a3d");
}

TEST(ArchiveCatalog, RenameRejectsEmptyAndTakenNames) {
    CatalogFixture f;
    WriteFile(f.root / "archives" / "test.a3d", "x");
    WriteFile(f.root / "archives" / "scan.a3d", "y");

    EXPECT_EQ(f.catalog->Rename("905b2aa9a9de2760", "").code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(f.catalog->Rename("905b2aa9a9de2760", "scan.a3d").code(),
              ErrorCode::kAlreadyExists);

    // Renaming to the current name is a no-op.
    auto same = f.catalog->Rename("905b2aa9a9de2760", "test.a3d");
    ASSERT_TRUE(same.ok());
    EXPECT_EQ(same.value().filename, "test.a3d");
}
