// tests/unit/run_coordinator_test.cpp
#include <gtest/gtest.h>
#include "common/crypto/include/EncryptionGate.hpp"
#include "common/storage/include/SecretFileStore.hpp"
#include "reconciler/RunCoordinator.hpp"
#include "reconciler/guard/include/DecryptedDefinitionGuard.hpp"
#include "support/FakeSecretService.hpp"
#include "support/TempDirectory.hpp"
#include <algorithm>

using namespace secret_reconciler;
using namespace secret_reconciler::reconciler;
using secret_reconciler::test_support::FakeSecretService;
using secret_reconciler::test_support::TempDirectory;
using json = nlohmann::json;

// ========== Helper ==========

namespace
{
    constexpr const char* kKey = "unit-test-passphrase";

    std::string PlainDefinition(const std::string& labels_json,
                                const std::string& extra_metadata = "",
                                const std::string& value = "s3cr3t")
    {
        return "{\n"
               "  \"__gcp_metadata\": {\"status\": \"plaintext\", \"labels\": " + labels_json + extra_metadata + "},\n"
               "  \"VALUE\": \"" + value + "\"\n"
               "}\n";
    }
}

class RunCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_shared<FakeSecretService>();
        options.source_root = dir.Path();
    }

    RunCoordinator MakeCoordinator(const std::string& key = kKey) {
        return RunCoordinator(service, crypto::EncryptionGate(key));
    }

    // 평문 정의를 암호화해서 디스크에 기록
    std::filesystem::path WriteEncrypted(const std::string& relative, const std::string& plain_content) {
        auto path = dir.Write(relative, plain_content);
        SecretDefinition def = store.ReadDefinition(path);
        store.WriteDefinition(path, crypto::EncryptionGate(kKey).Encrypt(def));
        return path;
    }

    const SecretOutcome& OutcomeFor(const RunResult& result, const std::string& name) {
        auto it = std::find_if(result.outcomes.begin(), result.outcomes.end(),
            [&name](const SecretOutcome& o) { return o.name == name; });
        EXPECT_NE(it, result.outcomes.end()) << name;
        return *it;
    }

    TempDirectory dir;
    storage::SecretFileStore store;
    std::shared_ptr<FakeSecretService> service;
    RunOptions options;
};

// ========== 시나리오 ==========

TEST_F(RunCoordinatorTest, TwoNewSecretsAreCreated) {
    dir.Write("db.json", PlainDefinition("[\"env=prod\"]"));
    dir.Write("api.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.total, 2u);
    EXPECT_EQ(result.succeeded, 2u);
    EXPECT_EQ(result.skipped, 0u);
    EXPECT_TRUE(result.failed.empty());

    EXPECT_EQ(service->CallsFor("db"), std::vector<std::string>{"create:db"});
    EXPECT_EQ(service->CallsFor("api"), std::vector<std::string>{"create:api"});
    EXPECT_EQ(service->CountCalls("list"), 1u);
}

TEST_F(RunCoordinatorTest, ExistingSecretGetsLabelsVersionAndRetirement) {
    service->Seed("db.secret", {{"env", "staging"}}, 3);
    dir.Write("db.secret.json", PlainDefinition("[\"env=prod\"]", ", \"onUpdateBehavior\": \"destroy\""));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(service->CallsFor("db.secret"), (std::vector<std::string>{
        "update-labels:db.secret", "add-version:db.secret", "destroy:db.secret:3"}));
    EXPECT_EQ(service->Get("db.secret").labels.at("env"), "prod");
}

// ========== 업로드 내용 / 파일 복원 ==========

TEST_F(RunCoordinatorTest, UploadsDecryptedPayloadAndRestoresEncryptedFile) {
    auto path = WriteEncrypted("db.json", PlainDefinition("[]"));
    const std::string before = TempDirectory::Read(path);

    RunResult result = MakeCoordinator().Deploy(options);

    ASSERT_TRUE(result.overall_success);

    json uploaded = json::parse(service->Get("db").payloads.at(0));
    EXPECT_EQ(uploaded, json({{"VALUE", "s3cr3t"}}));

    EXPECT_EQ(TempDirectory::Read(path), before);
    EXPECT_TRUE(store.ReadDefinition(path).IsEncrypted());
}

TEST_F(RunCoordinatorTest, PlaintextFileKeepsItsMetadataAfterRun) {
    auto path = dir.Write("db.json", PlainDefinition("[\"env=prod\"]"));

    MakeCoordinator().Deploy(options);

    SecretDefinition after = store.ReadDefinition(path);
    EXPECT_FALSE(after.IsEncrypted());
    EXPECT_EQ(after.metadata.labels, (LabelList{{"env", "prod"}}));
    EXPECT_EQ(after.payload["VALUE"], "s3cr3t");
}

TEST_F(RunCoordinatorTest, FailedUploadStillRestoresEncryptedFile) {
    service->Seed("db", {}, 2);
    service->FailOn("add-version:db");
    auto path = WriteEncrypted("db.json", PlainDefinition("[]"));
    const std::string before = TempDirectory::Read(path);

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.failed, std::vector<std::string>{"db"});
    EXPECT_EQ(OutcomeFor(result, "db").failed_in, SecretState::RECONCILING);
    EXPECT_EQ(TempDirectory::Read(path), before);
    EXPECT_EQ(service->CountCalls("destroy:"), 0u);
}

TEST_F(RunCoordinatorTest, WrongKeyFailsThatSecretAndLeavesFileUntouched) {
    auto path = WriteEncrypted("db.json", PlainDefinition("[]"));
    const std::string before = TempDirectory::Read(path);

    RunResult result = MakeCoordinator("a-different-key").Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(OutcomeFor(result, "db").failed_in, SecretState::DECRYPTING);
    EXPECT_NE(OutcomeFor(result, "db").error.find("Decryption failed"), std::string::npos);
    EXPECT_EQ(TempDirectory::Read(path), before);
    EXPECT_EQ(service->CountCalls("create:"), 0u);
}

// ========== 격리 ==========

TEST_F(RunCoordinatorTest, OneFailingSecretDoesNotStopTheOthers) {
    service->FailOn("create:api");
    dir.Write("api.json", PlainDefinition("[]"));
    dir.Write("broken.json", "{ not json");
    dir.Write("db.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.total, 3u);
    EXPECT_EQ(result.succeeded, 1u);
    EXPECT_EQ(result.failed, (std::vector<std::string>{"api", "broken"}));
    EXPECT_TRUE(service->Has("db"));
    EXPECT_TRUE(OutcomeFor(result, "db").success);
}

TEST_F(RunCoordinatorTest, BestEffortFailuresKeepSecretSuccessful) {
    service->Seed("db", {{"env", "old"}}, 1, {"Z"});
    service->FailOn("update-labels:db");
    service->FailOn("grant:db");
    dir.Write("db.json", PlainDefinition("[\"env=new\"]", ", \"serviceAccounts\": [\"X\"]"));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    const SecretOutcome& outcome = OutcomeFor(result, "db");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.warnings.size(), 2u);
    EXPECT_EQ(service->Get("db").bindings, PrincipalSet{});
}

TEST_F(RunCoordinatorTest, BindingsAreReadOnlyWhenDeclaredForExistingSecrets) {
    service->Seed("existing", {}, 1, {"Y", "Z"});
    dir.Write("existing.json", PlainDefinition("[]", ", \"serviceAccounts\": [\"X\", \"Y\"]"));
    dir.Write("fresh.json", PlainDefinition("[]", ", \"serviceAccounts\": [\"X\"]"));
    dir.Write("plain.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(service->CountCalls("get-bindings:"), 1u);
    EXPECT_EQ(service->CountCalls("get-bindings:existing"), 1u);
    EXPECT_EQ(service->Get("existing").bindings, (PrincipalSet{"X", "Y"}));
    EXPECT_EQ(service->Get("fresh").bindings, PrincipalSet{"X"});
}

TEST_F(RunCoordinatorTest, UnreadableBindingsSkipBindingChangesOnly) {
    service->Seed("db", {}, 1, {"Z"});
    service->FailOn("get-bindings:db");
    dir.Write("db.json", PlainDefinition("[]", ", \"serviceAccounts\": [\"X\"], \"onUpdateBehavior\": \"none\""));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(service->CallsFor("db"), (std::vector<std::string>{"get-bindings:db", "add-version:db"}));
}

TEST_F(RunCoordinatorTest, FilesSharingASecretNameFailWithoutRemoteCalls) {
    service->Seed("db", {}, 3);
    auto prod = dir.Write("prod/db.json", PlainDefinition("[]"));
    auto staging = dir.Write("staging/db.json", PlainDefinition("[]"));
    dir.Write("api.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(result.total, 3u);
    EXPECT_EQ(result.succeeded, 1u);
    EXPECT_EQ(result.failed, (std::vector<std::string>{"db", "db"}));

    EXPECT_TRUE(service->CallsFor("db").empty());
    EXPECT_EQ(service->Get("db").latest_version, 3);
    EXPECT_TRUE(service->Has("api"));

    for (const auto& outcome : result.outcomes) {
        if (outcome.name != "db") {
            continue;
        }
        EXPECT_NE(outcome.error.find(prod.string()), std::string::npos);
        EXPECT_NE(outcome.error.find(staging.string()), std::string::npos);
    }
}

TEST_F(RunCoordinatorTest, FilterSelectsNameThatOnlyOneFileDeclares) {
    dir.Write("prod/db.json", PlainDefinition("[]"));
    dir.Write("staging/db.json", PlainDefinition("[]"));
    dir.Write("api.json", PlainDefinition("[]"));
    options.secret_filter = "api";

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_TRUE(service->Has("api"));
}

// ========== 필터 / 실행 전체 ==========

TEST_F(RunCoordinatorTest, SecretFilterSkipsEverythingElse) {
    dir.Write("api.json", PlainDefinition("[]"));
    dir.Write("db.json", PlainDefinition("[]"));
    options.secret_filter = "db";

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.total, 2u);
    EXPECT_EQ(result.succeeded, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_TRUE(OutcomeFor(result, "api").IsSkipped());
    EXPECT_FALSE(service->Has("api"));
    EXPECT_TRUE(service->Has("db"));
}

TEST_F(RunCoordinatorTest, FilterMatchingNothingSucceedsTrivially) {
    dir.Write("api.json", PlainDefinition("[]"));
    options.secret_filter = "missing";

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.succeeded, result.total);
    EXPECT_EQ(service->CountCalls("create:"), 0u);
}

TEST_F(RunCoordinatorTest, EmptySourceRootSucceeds) {
    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_EQ(result.total, 0u);
}

TEST_F(RunCoordinatorTest, ListingFailureFailsTheWholeRun) {
    service->FailOn("list");
    auto path = WriteEncrypted("db.json", PlainDefinition("[]"));
    const std::string before = TempDirectory::Read(path);

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(TempDirectory::Read(path), before);
}

TEST_F(RunCoordinatorTest, MissingSourceRootFailsTheRun) {
    options.source_root = dir.Path() / "missing";

    RunResult result = MakeCoordinator().Deploy(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_EQ(service->CountCalls("list"), 0u);
}

TEST_F(RunCoordinatorTest, NoEncryptionKeyIsASuccessfulNoOp) {
    dir.Write("db.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator("").Deploy(options);

    EXPECT_TRUE(result.overall_success);
    EXPECT_TRUE(result.short_circuited);
    EXPECT_TRUE(service->Calls().empty());
}

TEST_F(RunCoordinatorTest, ProjectIsPassedToEveryCall) {
    dir.Write("db.json", PlainDefinition("[]"));
    options.project = "prod-project";

    MakeCoordinator().Deploy(options);

    EXPECT_EQ(service->LastProject(), "prod-project");
}

// ========== encrypt / decrypt ==========

TEST_F(RunCoordinatorTest, EncryptAndDecryptRewriteFilesInPlace) {
    auto path = dir.Write("db.json", PlainDefinition("[\"env=prod\"]"));
    RunCoordinator coordinator = MakeCoordinator();

    RunResult encrypted = coordinator.EncryptFiles(options);
    ASSERT_TRUE(encrypted.overall_success);
    SecretDefinition on_disk = store.ReadDefinition(path);
    EXPECT_TRUE(on_disk.IsEncrypted());
    EXPECT_NE(on_disk.payload["VALUE"], "s3cr3t");

    RunResult decrypted = coordinator.DecryptFiles(options);
    ASSERT_TRUE(decrypted.overall_success);
    on_disk = store.ReadDefinition(path);
    EXPECT_FALSE(on_disk.IsEncrypted());
    EXPECT_EQ(on_disk.payload["VALUE"], "s3cr3t");
    EXPECT_EQ(on_disk.metadata.labels, (LabelList{{"env", "prod"}}));
}

TEST_F(RunCoordinatorTest, EncryptWithoutKeyFails) {
    dir.Write("db.json", PlainDefinition("[]"));

    RunResult result = MakeCoordinator("").EncryptFiles(options);

    EXPECT_FALSE(result.overall_success);
    EXPECT_FALSE(result.error.empty());
}

// ========== DecryptedDefinitionGuard ==========

TEST_F(RunCoordinatorTest, GuardRestoresOnScopeExit) {
    auto path = WriteEncrypted("db.json", PlainDefinition("[]"));
    const std::string before = TempDirectory::Read(path);
    crypto::EncryptionGate gate(kKey);

    try {
        DecryptedDefinitionGuard guard(store, gate, store.ReadDefinition(path));
        json staged = json::parse(TempDirectory::Read(guard.DataFile()));
        EXPECT_EQ(staged, json({{"VALUE", "s3cr3t"}}));
        throw std::runtime_error("simulated failure");
    } catch (const std::runtime_error&) {
    }

    EXPECT_EQ(TempDirectory::Read(path), before);
}
