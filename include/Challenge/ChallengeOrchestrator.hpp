#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "Challenge/ChallengeDefinition.hpp"
#include "Challenge/ChallengeSession.hpp"
#include "Core/concurrency/CancelFlag.hpp"
#include "Core/config/LabConfig.hpp"
#include "Core/interfaces/IHypervisorSession.hpp"
#include "Core/interfaces/IRemoteExecutor.hpp"

struct OrchestratorSettings {
    std::string uri{"qemu:///system"};
    SshSettings ssh;
    ReadinessSettings readiness;
    SnapshotSettings snapshot;
    std::chrono::seconds shutdownTimeout{120};

    [[nodiscard]] static OrchestratorSettings fromConfig(const LabConfig& cfg);
};

/**
 * @brief Drives one challenge session through its phases.
 *
 * Loaded -> SnapshotCreated -> VMReady -> SetupComplete ->
 * {Simulated | AwaitingUserAction} -> Validated -> CleanedUp -> Done,
 * with Aborted reachable from every non-terminal phase.
 *
 * The hypervisor session is opened on demand and owned by this instance;
 * it is released when the run suspends or reaches a terminal phase.
 */
class ChallengeOrchestrator {
public:
    ChallengeOrchestrator(HypervisorSessionFactory factory,
                          std::shared_ptr<IRemoteExecutor> ssh,
                          OrchestratorSettings settings);
    ~ChallengeOrchestrator();

    ChallengeOrchestrator(const ChallengeOrchestrator&) = delete;
    ChallengeOrchestrator& operator=(const ChallengeOrchestrator&) = delete;

    [[nodiscard]] ChallengeSession createSession(const ChallengeDefinition& def, const std::string& vm,
                                                 const RunOptions& options) const;

    // يتقدم حتى التعليق أو حالة نهائية
    void run(ChallengeSession& session, const ChallengeDefinition& def,
             const CONCURRENCY::CancelFlag& cancel = nullptr);

    // إشارة "متابعة" لجلسة في AwaitingUserAction
    void resume(ChallengeSession& session, const ChallengeDefinition& def,
                const CONCURRENCY::CancelFlag& cancel = nullptr);

    // تنظيف بأفضل جهد ثم Aborted
    void cancel(ChallengeSession& session, const ChallengeDefinition& def);

    // انتقال واحد؛ false عند التعليق أو الانتهاء
    bool advance(ChallengeSession& session, const ChallengeDefinition& def,
                 const CONCURRENCY::CancelFlag& cancel = nullptr);

    [[nodiscard]] static bool isValidTransition(ChallengePhase from, ChallengePhase to) noexcept;
    [[nodiscard]] static std::string snapshotNameFor(const std::string& prefix, const std::string& challengeId,
                                                     const std::string& sessionId);

private:
    HypervisorSessionFactory factory_;
    std::shared_ptr<IRemoteExecutor> ssh_;
    OrchestratorSettings settings_;
    std::unique_ptr<IHypervisorSession> hypervisor_;

    IHypervisorSession& hypervisor();
    void releaseHypervisor() noexcept;
    [[nodiscard]] SshTarget targetFor(const ChallengeSession& session) const;

    void enter(ChallengeSession& session, ChallengePhase next);
    void createSnapshot(ChallengeSession& session, const ChallengeDefinition& def);
    void prepareVm(ChallengeSession& session, const CONCURRENCY::CancelFlag& cancel);
    void runSetup(ChallengeSession& session, const ChallengeDefinition& def);
    void performUserAction(ChallengeSession& session, const ChallengeDefinition& def);
    void validate(ChallengeSession& session, const ChallengeDefinition& def);
    void cleanUp(ChallengeSession& session);
    void finish(ChallengeSession& session, const ChallengeDefinition& def);

    void abort(ChallengeSession& session, const ChallengeDefinition& def, FailureRecord failure);
    void restoreSnapshot(ChallengeSession& session, CleanupRecord& record);
    void drive(ChallengeSession& session, const ChallengeDefinition& def, const CONCURRENCY::CancelFlag& cancel);
    [[nodiscard]] RunReport buildReport(const ChallengeSession& session, const ChallengeDefinition& def) const;
};
