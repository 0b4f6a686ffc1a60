#include <gtest/gtest.h>
#include "Challenge/SessionStore.hpp"
#include "Storage/RocksDbStore.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

ChallengeSession suspendedSession(const std::string& id) {
    ChallengeSession s;
    s.id = id;
    s.challengeId = "set_hostname";
    s.challengeSource = "/srv/challenges/set_hostname.yaml";
    s.vmName = "demo";
    s.options.keepSnapshot = true;
    s.phase = ChallengePhase::AwaitingUserAction;
    s.snapshot = SnapshotRecord{"practice-set_hostname-" + id.substr(0, 8), true, true};
    s.guest = GuestEndpoint{"192.168.122.50"};
    StepOutcome setup;
    setup.kind = "run_command";
    setup.command = "sudo hostnamectl set-hostname lab-default --static";
    setup.passed = true;
    setup.exitCode = 0;
    s.setupResults.push_back(setup);
    s.userAction = UserActionRecord{false, std::nullopt};
    s.startedAt = 1700000000;
    s.activeSeconds = 12.5;
    return s;
}

} // namespace

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("practicelab-sessions-" + std::to_string(::getpid()));
        fs::remove_all(dir);
        db = std::make_shared<RocksDbStore>();
        ASSERT_TRUE(db->Open(dir.string()).has_value());
    }

    void TearDown() override {
        db->Close();
        fs::remove_all(dir);
    }

    fs::path dir;
    std::shared_ptr<RocksDbStore> db;
};

TEST_F(SessionStoreTest, SuspendedSessionSurvivesSaveAndLoad) {
    SessionStore store(db);
    const auto original = suspendedSession("0f8fad5b-d9cb-469f-a165-70867728950e");
    ASSERT_TRUE(store.save(original).has_value());

    const auto loaded = store.load(original.id);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->phase, ChallengePhase::AwaitingUserAction);
    EXPECT_EQ(loaded->challengeSource, original.challengeSource);
    EXPECT_TRUE(loaded->options.keepSnapshot);
    ASSERT_TRUE(loaded->snapshot);
    EXPECT_EQ(loaded->snapshot->name, "practice-set_hostname-0f8fad5b");
    EXPECT_TRUE(loaded->snapshot->vmWasRunning);
    EXPECT_EQ(loaded->guest->ip, "192.168.122.50");
    ASSERT_EQ(loaded->setupResults.size(), 1u);
    EXPECT_EQ(loaded->setupResults[0].exitCode, 0);
    EXPECT_DOUBLE_EQ(loaded->activeSeconds, 12.5);
    EXPECT_FALSE(loaded->failure);
}

TEST_F(SessionStoreTest, AbortedSessionKeepsFailureDetails) {
    auto session = suspendedSession("11111111-2222-3333-4444-555555555555");
    session.phase = ChallengePhase::Aborted;
    session.failure = FailureRecord{ErrorKind::Timeout, ChallengePhase::SnapshotCreated, "SSH not ready", std::nullopt, false};
    session.cleanup = CleanupRecord{false, true, true, "metadata removed", {"power state not restored"}};

    const auto back = SessionStore::deserialize(SessionStore::serialize(session));
    ASSERT_TRUE(back.has_value());
    ASSERT_TRUE(back->failure);
    EXPECT_EQ(back->failure->kind, ErrorKind::Timeout);
    EXPECT_EQ(back->failure->phase, ChallengePhase::SnapshotCreated);
    EXPECT_EQ(back->cleanup->warnings, std::vector<std::string>{"power state not restored"});
}

TEST_F(SessionStoreTest, ListAndRemove) {
    SessionStore store(db);
    ASSERT_TRUE(store.save(suspendedSession("aaaaaaaa-0000-0000-0000-000000000000")).has_value());
    ASSERT_TRUE(store.save(suspendedSession("bbbbbbbb-0000-0000-0000-000000000000")).has_value());
    ASSERT_TRUE(db->Put("other/key", "not a session").has_value());

    auto all = store.list();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 2u);

    ASSERT_TRUE(store.remove("aaaaaaaa-0000-0000-0000-000000000000").has_value());
    all = store.list();
    ASSERT_EQ(all->size(), 1u);
    EXPECT_EQ(all->front().id, "bbbbbbbb-0000-0000-0000-000000000000");
}

TEST_F(SessionStoreTest, UnknownIdIsAnError) {
    SessionStore store(db);
    const auto missing = store.load("does-not-exist");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("does-not-exist"), std::string::npos);
}

TEST_F(SessionStoreTest, CorruptDocumentsAreRejected) {
    EXPECT_FALSE(SessionStore::deserialize("{not json").has_value());
    EXPECT_FALSE(SessionStore::deserialize(R"({"id":"x","challenge_id":"y","phase":"Nowhere"})").has_value());
    EXPECT_FALSE(SessionStore::deserialize(R"({"phase":"Loaded"})").has_value());

    SessionStore store(db);
    ASSERT_TRUE(db->Put("session/broken", "{oops").has_value());
    const auto all = store.list();
    ASSERT_TRUE(all.has_value());
    EXPECT_TRUE(all->empty());
}

TEST(RocksDbStoreTest, OperationsFailWhenClosed) {
    RocksDbStore db;
    EXPECT_FALSE(db.isOpen());
    EXPECT_FALSE(db.Put("k", "v").has_value());
    EXPECT_FALSE(db.Get("k").has_value());
}
