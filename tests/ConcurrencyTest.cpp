#include <gtest/gtest.h>
#include "Challenge/ChallengeLoader.hpp"
#include "Challenge/ChallengeScheduler.hpp"
#include "Core/concurrency/EventDispatcher.hpp"
#include "Core/concurrency/VmLockRegistry.hpp"
#include "fakes/FakeGuest.hpp"
#include "fakes/FakeHypervisor.hpp"
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include <stdexcept>

using namespace std::chrono_literals;

TEST(VmLockRegistryTest, SameVmIsSerialized) {
    auto& registry = CONCURRENCY::VmLockRegistry::instance();
    auto held = registry.acquire("test#demo");

    auto other = std::async(std::launch::async, [&registry] {
        auto lock = registry.acquire("test#demo");
        return true;
    });
    EXPECT_EQ(other.wait_for(100ms), std::future_status::timeout);

    held.unlock();
    EXPECT_TRUE(other.get());
}

TEST(VmLockRegistryTest, DifferentVmsDoNotBlock) {
    auto& registry = CONCURRENCY::VmLockRegistry::instance();
    auto first = registry.acquire("test#one");
    auto second = std::async(std::launch::async, [&registry] {
        auto lock = registry.acquire("test#two");
        return lock.owns_lock();
    });
    ASSERT_EQ(second.wait_for(1s), std::future_status::ready);
    EXPECT_TRUE(second.get());
}

TEST(EventDispatcherTest, RunsPostedTasks) {
    CONCURRENCY::EventDispatcher dispatcher(2);
    std::promise<int> result;
    dispatcher.dispatch([&result] { result.set_value(42); });
    auto future = result.get_future();
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(future.get(), 42);
}

TEST(EventDispatcherTest, ThrowingTaskDoesNotKillTheWorker) {
    CONCURRENCY::EventDispatcher dispatcher(1);
    dispatcher.dispatch([] { throw std::runtime_error("task failure"); });
    std::promise<void> after;
    dispatcher.dispatch([&after] { after.set_value(); });
    EXPECT_EQ(after.get_future().wait_for(1s), std::future_status::ready);
}

TEST(EventDispatcherTest, DelayedTaskCanBeCancelled) {
    CONCURRENCY::EventDispatcher dispatcher(1);
    std::atomic<bool> fired{false};
    auto timer = dispatcher.dispatch_delayed(200ms, [&fired] { fired = true; });
    timer->cancel();

    std::promise<void> later;
    auto marker = dispatcher.dispatch_delayed(300ms, [&later] { later.set_value(); });
    ASSERT_EQ(later.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(fired);
}

TEST(EventDispatcherTest, DroppingTheTimerCancelsTheTask) {
    CONCURRENCY::EventDispatcher dispatcher(1);
    std::atomic<bool> fired{false};
    dispatcher.dispatch_delayed(100ms, [&fired] { fired = true; }).reset();

    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(fired);
}

class ChallengeSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.uri = "test:///fake";
        settings.readiness.timeout = 2s;
        settings.readiness.pollInterval = 1s;
        def = ChallengeLoader::fromFile(std::filesystem::path(PRACTICELAB_CHALLENGE_DIR) / "set_hostname.yaml");
    }

    ChallengeScheduler::OrchestratorFactory factoryFor(std::shared_ptr<FakeHypervisorState> state,
                                                       std::shared_ptr<FakeGuest> guest) {
        return [this, state, guest] {
            state->onCreate = [guest] { guest->takeSnapshot(); };
            state->onRevert = [guest] { guest->restoreSnapshot(); };
            return std::make_unique<ChallengeOrchestrator>(FakeHypervisor::factory(state), guest, settings);
        };
    }

    OrchestratorSettings settings;
    ChallengeDefinition def;
};

TEST_F(ChallengeSchedulerTest, RunsSubmittedSessionToCompletion) {
    auto state = std::make_shared<FakeHypervisorState>();
    auto guest = std::make_shared<FakeGuest>();
    ChallengeScheduler scheduler(factoryFor(state, guest), 2);

    auto probe = factoryFor(state, guest)();
    auto session = probe->createSession(def, "demo", RunOptions{true, false});
    probe.reset();

    std::promise<ChallengeSession> done;
    auto flag = scheduler.submit(session, def, [&done](const ChallengeSession& s) { done.set_value(s); });
    EXPECT_TRUE(flag);

    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    const auto finished = future.get();
    EXPECT_EQ(finished.phase, ChallengePhase::Done);
    EXPECT_TRUE(finished.verdict->passed);

    scheduler.waitIdle();
    EXPECT_EQ(scheduler.active(), 0u);
}

TEST_F(ChallengeSchedulerTest, CancelledSessionIsAborted) {
    auto state = std::make_shared<FakeHypervisorState>();
    state->ip.reset();  // ينتظر عنوانا لن يظهر
    auto guest = std::make_shared<FakeGuest>();
    settings.readiness.timeout = 30s;
    ChallengeScheduler scheduler(factoryFor(state, guest), 1);

    auto session = factoryFor(state, guest)()->createSession(def, "demo", RunOptions{true, false});
    std::promise<ChallengeSession> done;
    auto flag = scheduler.submit(session, def, [&done](const ChallengeSession& s) { done.set_value(s); });

    std::this_thread::sleep_for(300ms);
    scheduler.cancel(session.id);

    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    const auto finished = future.get();
    EXPECT_EQ(finished.phase, ChallengePhase::Aborted);
    EXPECT_TRUE(finished.failure->cancelled);
    EXPECT_TRUE(CONCURRENCY::isCancelled(flag));
    EXPECT_TRUE(state->snapshots.empty());
}

TEST_F(ChallengeSchedulerTest, BusyVmDoesNotBlockOtherVms) {
    auto state = std::make_shared<FakeHypervisorState>();
    state->unreachable.insert("vm-a");  // الجلسة الأولى على vm-a تبقى تنتظر
    auto guest = std::make_shared<FakeGuest>();
    settings.readiness.timeout = 30s;
    ChallengeScheduler scheduler(factoryFor(state, guest), 2, 50ms);

    auto creator = factoryFor(state, guest)();
    auto first = creator->createSession(def, "vm-a", RunOptions{true, false});
    auto second = creator->createSession(def, "vm-a", RunOptions{true, false});
    auto other = creator->createSession(def, "vm-b", RunOptions{true, false});
    creator.reset();

    std::promise<ChallengeSession> firstDone, secondDone, otherDone;
    scheduler.submit(first, def, [&firstDone](const ChallengeSession& s) { firstDone.set_value(s); });
    std::this_thread::sleep_for(200ms);
    scheduler.submit(second, def, [&secondDone](const ChallengeSession& s) { secondDone.set_value(s); });
    scheduler.submit(other, def, [&otherDone](const ChallengeSession& s) { otherDone.set_value(s); });

    // عامل واحد مشغول بـ vm-a والآخر يكمل vm-b
    auto otherFuture = otherDone.get_future();
    ASSERT_EQ(otherFuture.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(otherFuture.get().phase, ChallengePhase::Done);

    auto secondFuture = secondDone.get_future();
    EXPECT_EQ(secondFuture.wait_for(200ms), std::future_status::timeout);
    EXPECT_EQ(scheduler.active(), 2u);

    // الجلسة المنتظرة تلغى فورا لأنها لم تنشئ لقطة
    scheduler.cancel(second.id);
    ASSERT_EQ(secondFuture.wait_for(5s), std::future_status::ready);
    const auto cancelled = secondFuture.get();
    EXPECT_EQ(cancelled.phase, ChallengePhase::Aborted);
    EXPECT_TRUE(cancelled.failure->cancelled);
    EXPECT_FALSE(cancelled.snapshot && cancelled.snapshot->created);

    scheduler.cancel(first.id);
    auto firstFuture = firstDone.get_future();
    ASSERT_EQ(firstFuture.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(firstFuture.get().phase, ChallengePhase::Aborted);

    scheduler.waitIdle();
    EXPECT_EQ(scheduler.active(), 0u);
}

TEST_F(ChallengeSchedulerTest, SameVmSessionsRunOneAfterAnother) {
    auto state = std::make_shared<FakeHypervisorState>();
    auto guest = std::make_shared<FakeGuest>();
    ChallengeScheduler scheduler(factoryFor(state, guest), 2, 50ms);

    auto creator = factoryFor(state, guest)();
    auto first = creator->createSession(def, "demo", RunOptions{true, false});
    auto second = creator->createSession(def, "demo", RunOptions{true, false});
    creator.reset();

    std::mutex mutex;
    std::vector<std::string> finished;
    auto record = [&](const ChallengeSession& s) {
        std::lock_guard lock(mutex);
        finished.push_back(s.id + ":" + std::string(toString(s.phase)));
    };
    scheduler.submit(first, def, record);
    scheduler.submit(second, def, record);
    scheduler.waitIdle();

    ASSERT_EQ(finished.size(), 2u);
    // كل جلسة أنشأت لقطتها وأعادتها قبل أن تبدأ الأخرى
    std::vector<std::string> mutations;
    for (const auto& call : state->calls) {
        if (call.rfind("create:", 0) == 0 || call.rfind("revert:", 0) == 0) mutations.push_back(call.substr(0, 6));
    }
    ASSERT_EQ(mutations.size(), 4u);
    EXPECT_EQ(mutations[0], "create");
    EXPECT_EQ(mutations[1], "revert");
    EXPECT_EQ(mutations[2], "create");
    EXPECT_EQ(mutations[3], "revert");
}

TEST_F(ChallengeSchedulerTest, FailureOutsideTheOrchestratorStillCompletes) {
    ChallengeScheduler scheduler([]() -> std::unique_ptr<ChallengeOrchestrator> { return nullptr; }, 1);

    ChallengeSession session;
    session.id = "broken";
    session.challengeId = def.id;
    session.vmName = "demo";

    std::promise<ChallengeSession> done;
    scheduler.submit(session, def, [&done](const ChallengeSession& s) { done.set_value(s); });

    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    const auto finished = future.get();
    EXPECT_EQ(finished.phase, ChallengePhase::Aborted);
    ASSERT_TRUE(finished.failure.has_value());
    EXPECT_FALSE(finished.failure->cancelled);
    EXPECT_NE(finished.failure->message.find("orchestrator factory"), std::string::npos);
    ASSERT_TRUE(finished.report.has_value());
    EXPECT_FALSE(finished.report->success);

    scheduler.waitIdle();
    EXPECT_EQ(scheduler.active(), 0u);
}

TEST_F(ChallengeSchedulerTest, ThrowingCompletionHandlerDoesNotStallTheScheduler) {
    auto state = std::make_shared<FakeHypervisorState>();
    auto guest = std::make_shared<FakeGuest>();
    ChallengeScheduler scheduler(factoryFor(state, guest), 1);

    auto session = factoryFor(state, guest)()->createSession(def, "demo", RunOptions{true, false});
    scheduler.submit(session, def, [](const ChallengeSession&) { throw std::runtime_error("handler failure"); });

    scheduler.waitIdle();
    EXPECT_EQ(scheduler.active(), 0u);
}
