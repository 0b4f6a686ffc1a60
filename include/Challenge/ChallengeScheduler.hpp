#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include "Challenge/ChallengeOrchestrator.hpp"
#include "Core/concurrency/CancelFlag.hpp"
#include "Core/concurrency/EventDispatcher.hpp"

/**
 * @brief Runs challenge sessions on a worker pool.
 *
 * Runs on different VMs proceed in parallel, each with its own orchestrator
 * and hypervisor session. A session whose VM is already in use does not
 * occupy a worker: it is re-queued on a timer until the VM is free. A
 * cancelled session that never created its snapshot finishes without
 * waiting for the VM.
 *
 * The completion callback runs exactly once per submitted session, also
 * when the session fails outside the orchestrator; the session then ends
 * Aborted with a failure record.
 */
class ChallengeScheduler {
public:
    using OrchestratorFactory = std::function<std::unique_ptr<ChallengeOrchestrator>()>;
    using Completion = std::function<void(const ChallengeSession&)>;

    explicit ChallengeScheduler(OrchestratorFactory factory, std::size_t workers = 2,
                                std::chrono::milliseconds retryInterval = std::chrono::milliseconds(250));
    ~ChallengeScheduler();

    ChallengeScheduler(const ChallengeScheduler&) = delete;
    ChallengeScheduler& operator=(const ChallengeScheduler&) = delete;

    // يعيد علم الإلغاء الخاص بالجلسة
    CONCURRENCY::CancelFlag submit(ChallengeSession session, ChallengeDefinition def, Completion done);

    void cancel(const std::string& sessionId);
    void cancelAll();
    void waitIdle();
    [[nodiscard]] std::size_t active() const;

private:
    struct Job {
        ChallengeSession session;
        ChallengeDefinition def;
        CONCURRENCY::CancelFlag flag;
        Completion done;
    };

    void tryStart(const std::shared_ptr<Job>& job);
    void runJob(const std::shared_ptr<Job>& job, bool ownsVm);
    ChallengeSession execute(ChallengeSession session, const ChallengeDefinition& def,
                             const CONCURRENCY::CancelFlag& flag);

    OrchestratorFactory factory_;
    std::chrono::milliseconds retryInterval_;
    CONCURRENCY::EventDispatcher dispatcher_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<std::string, CONCURRENCY::CancelFlag> jobs_;
    std::unordered_set<std::string> busyVms_;
    // جلسات تنتظر جهازا مشغولا
    std::unordered_map<std::string, std::shared_ptr<CONCURRENCY::Timer>> waiting_;
};
