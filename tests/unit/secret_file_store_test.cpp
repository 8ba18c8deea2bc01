// tests/unit/secret_file_store_test.cpp
#include <gtest/gtest.h>
#include "common/storage/include/DefinitionCodec.hpp"
#include "common/storage/include/SecretFileStore.hpp"
#include "common/storage/include/StorageException.hpp"
#include "support/TempDirectory.hpp"

using namespace secret_reconciler;
using namespace secret_reconciler::storage;
using secret_reconciler::test_support::TempDirectory;
using json = nlohmann::json;

namespace
{
    const char* kDbDefinition = R"({
  "__gcp_metadata": {
    "status": "plaintext",
    "labels": ["env=prod", "team=core"],
    "serviceAccounts": ["serviceAccount:api@p.iam.gserviceaccount.com"],
    "onUpdateBehavior": "disable",
    "owner": "platform"
  },
  "DB_PASSWORD": "hunter2",
  "PORT": 5432
})";
}

// ========== DefinitionCodec ==========

TEST(DefinitionCodecTest, ParsesPayloadAndTypedMetadata) {
    SecretDefinition def = DefinitionCodec::Parse(kDbDefinition, "secrets/db.secret.json");

    EXPECT_EQ(def.name, "db.secret");
    EXPECT_FALSE(def.IsEncrypted());
    EXPECT_EQ(def.payload, json({{"DB_PASSWORD", "hunter2"}, {"PORT", 5432}}));
    EXPECT_FALSE(def.payload.contains(kMetadataKey));

    LabelList expected_labels{{"env", "prod"}, {"team", "core"}};
    EXPECT_EQ(def.metadata.labels, expected_labels);
    ASSERT_TRUE(def.metadata.service_accounts.has_value());
    EXPECT_EQ(def.metadata.service_accounts->count("serviceAccount:api@p.iam.gserviceaccount.com"), 1u);
    EXPECT_EQ(def.metadata.on_update_behavior, UpdateBehavior::DISABLE);
    EXPECT_EQ(def.metadata.extra_fields.value("owner", ""), "platform");
}

TEST(DefinitionCodecTest, OptionalFieldsDefault) {
    SecretDefinition def = DefinitionCodec::Parse(
        R"({"__gcp_metadata": {"status": "encrypted", "labels": []}, "KEY": "a:b:c"})", "api.json");

    EXPECT_EQ(def.name, "api");
    EXPECT_TRUE(def.IsEncrypted());
    EXPECT_TRUE(def.metadata.labels.empty());
    EXPECT_FALSE(def.metadata.service_accounts.has_value());
    EXPECT_EQ(def.metadata.on_update_behavior, UpdateBehavior::DESTROY);
}

TEST(DefinitionCodecTest, LabelsMayBeAnObject) {
    SecretDefinition def = DefinitionCodec::Parse(
        R"({"__gcp_metadata": {"status": "plaintext", "labels": {"env": "prod"}}})", "x.json");

    EXPECT_TRUE(def.metadata.labels_as_object);
    EXPECT_EQ(def.metadata.labels, (LabelList{{"env", "prod"}}));

    // 다시 쓸 때 원래 형식 유지
    json written = json::parse(DefinitionCodec::Serialize(def));
    EXPECT_TRUE(written[kMetadataKey]["labels"].is_object());
}

TEST(DefinitionCodecTest, UnrecognizedBehaviorIsKeptNotRejected) {
    SecretDefinition def = DefinitionCodec::Parse(
        R"({"__gcp_metadata": {"status": "plaintext", "labels": [], "onUpdateBehavior": "shred"}})", "x.json");

    EXPECT_EQ(def.metadata.on_update_behavior, UpdateBehavior::UNRECOGNIZED);
    EXPECT_EQ(def.metadata.on_update_behavior_raw, "shred");
}

TEST(DefinitionCodecTest, MalformedDefinitionsAreRejected) {
    const char* cases[] = {
        "not json",
        "[1, 2]",
        R"({"KEY": "no metadata"})",
        R"({"__gcp_metadata": "plaintext"})",
        R"({"__gcp_metadata": {"labels": []}})",
        R"({"__gcp_metadata": {"status": "maybe", "labels": []}})",
        R"({"__gcp_metadata": {"status": "plaintext"}})",
        R"({"__gcp_metadata": {"status": "plaintext", "labels": "env=prod"}})",
        R"({"__gcp_metadata": {"status": "plaintext", "labels": ["no-equals"]}})",
        R"({"__gcp_metadata": {"status": "plaintext", "labels": ["env=a", "env=b"]}})",
        R"({"__gcp_metadata": {"status": "plaintext", "labels": [], "serviceAccounts": "sa"}})",
        R"({"__gcp_metadata": {"status": "plaintext", "labels": [], "onUpdateBehavior": 3}})",
    };

    for (const char* content : cases) {
        EXPECT_THROW(DefinitionCodec::Parse(content, "bad.json"), MalformedDefinitionException) << content;
    }
}

TEST(DefinitionCodecTest, DuplicateLabelKeysAreRejected) {
    try {
        DefinitionCodec::Parse(
            R"({"__gcp_metadata": {"status": "plaintext", "labels": ["env=a", "team=core", "env=b"]}})", "db.json");
        FAIL() << "expected MalformedDefinitionException";
    } catch (const MalformedDefinitionException& e) {
        EXPECT_NE(std::string(e.what()).find("'env'"), std::string::npos);
    }
}

TEST(DefinitionCodecTest, PayloadDocumentHasNoMetadata) {
    SecretDefinition def = DefinitionCodec::Parse(kDbDefinition, "db.json");

    json payload = json::parse(DefinitionCodec::SerializePayload(def));
    EXPECT_FALSE(payload.contains(kMetadataKey));
    EXPECT_EQ(payload["DB_PASSWORD"], "hunter2");

    json full = json::parse(DefinitionCodec::Serialize(def));
    EXPECT_EQ(full[kMetadataKey]["status"], "plaintext");
    EXPECT_EQ(full[kMetadataKey]["onUpdateBehavior"], "disable");
    EXPECT_EQ(full[kMetadataKey]["owner"], "platform");
}

// ========== SecretFileStore ==========

class SecretFileStoreTest : public ::testing::Test {
protected:
    TempDirectory dir;
    SecretFileStore store;
};

TEST_F(SecretFileStoreTest, ListsJsonFilesRecursivelyInPathOrder) {
    dir.Write("zeta.json", "{}");
    dir.Write("alpha.json", "{}");
    dir.Write("nested/beta.json", "{}");
    dir.Write("README.md", "docs");
    dir.Write(".hidden.json", "{}");
    dir.Write(".git/config.json", "{}");
    dir.Write("alpha.json.tmp-1234abcd", "{}");

    auto files = store.ListSecretFiles(dir.Path());

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], dir.Path() / "alpha.json");
    EXPECT_EQ(files[1], dir.Path() / "nested" / "beta.json");
    EXPECT_EQ(files[2], dir.Path() / "zeta.json");
}

TEST_F(SecretFileStoreTest, MissingSourceRootThrows) {
    EXPECT_THROW(store.ListSecretFiles(dir.Path() / "missing"), StorageException);

    auto file = dir.Write("file.json", "{}");
    EXPECT_THROW(store.ListSecretFiles(file), StorageException);
}

TEST_F(SecretFileStoreTest, ReadDefinitionReportsMalformedFile) {
    auto good = dir.Write("db.json", kDbDefinition);
    auto bad = dir.Write("bad.json", R"({"KEY": 1})");

    EXPECT_EQ(store.ReadDefinition(good).name, "db");
    EXPECT_EQ(store.ReadDefinition(good).file_path, good);
    EXPECT_THROW(store.ReadDefinition(bad), MalformedDefinitionException);
    EXPECT_THROW(store.ReadDefinition(dir.Path() / "missing.json"), StorageException);
}

TEST_F(SecretFileStoreTest, WriteDefinitionReplacesFileWithoutLeftovers) {
    auto file = dir.Write("db.json", kDbDefinition);
    SecretDefinition def = store.ReadDefinition(file);

    def.payload["DB_PASSWORD"] = "changed";
    store.WriteDefinition(file, def);

    SecretDefinition reread = store.ReadDefinition(file);
    EXPECT_EQ(reread.payload["DB_PASSWORD"], "changed");
    EXPECT_EQ(reread.metadata.labels, def.metadata.labels);

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.Path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(SecretFileStoreTest, WritePayloadOnlyDropsMetadata) {
    auto file = dir.Write("db.json", kDbDefinition);
    SecretDefinition def = store.ReadDefinition(file);

    store.WritePayloadOnly(file, def);

    json on_disk = json::parse(TempDirectory::Read(file));
    EXPECT_FALSE(on_disk.contains(kMetadataKey));
    EXPECT_EQ(on_disk["PORT"], 5432);
}

TEST_F(SecretFileStoreTest, WriteIntoMissingDirectoryThrows) {
    SecretDefinition def = DefinitionCodec::Parse(kDbDefinition, "db.json");
    EXPECT_THROW(store.WriteDefinition(dir.Path() / "missing" / "db.json", def), StorageException);
}
