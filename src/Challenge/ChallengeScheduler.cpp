#include "Challenge/ChallengeScheduler.hpp"
#include "Utils/Logger.hpp"
#include <stdexcept>

namespace {

ChallengeSession failedSession(ChallengeSession session, const std::string& message) {
    session.failure = FailureRecord{std::nullopt, session.phase, message, std::nullopt, false};
    session.phase = ChallengePhase::Aborted;
    RunReport report;
    report.success = false;
    report.message = message;
    session.report = report;
    return session;
}

bool snapshotCreated(const ChallengeSession& session) {
    return session.snapshot && session.snapshot->created;
}

} // namespace

ChallengeScheduler::ChallengeScheduler(OrchestratorFactory factory, std::size_t workers,
                                       std::chrono::milliseconds retryInterval)
    : factory_(std::move(factory)), retryInterval_(retryInterval), dispatcher_(workers) {}

ChallengeScheduler::~ChallengeScheduler() {
    cancelAll();
    waitIdle();
    dispatcher_.stop();
}

CONCURRENCY::CancelFlag ChallengeScheduler::submit(ChallengeSession session, ChallengeDefinition def, Completion done) {
    auto flag = CONCURRENCY::makeCancelFlag();
    {
        std::lock_guard lock(mutex_);
        jobs_[session.id] = flag;
    }
    BoostLogger::Info("Scheduling session {} ({} on {})", session.id, def.id, session.vmName);

    auto job = std::make_shared<Job>(Job{std::move(session), std::move(def), flag, std::move(done)});
    dispatcher_.dispatch([this, job] { tryStart(job); });
    return flag;
}

void ChallengeScheduler::tryStart(const std::shared_ptr<Job>& job) {
    const auto& id = job->session.id;
    const auto& vm = job->session.vmName;
    bool ownsVm = false;
    {
        std::lock_guard lock(mutex_);
        waiting_.erase(id);
        if (busyVms_.insert(vm).second) {
            ownsVm = true;
        } else if (!(CONCURRENCY::isCancelled(job->flag) && !snapshotCreated(job->session))) {
            // الجهاز مشغول: يعاد المحاولة لاحقا دون حجز عامل
            BoostLogger::Debug("Session {} waits for VM {}", id, vm);
            waiting_[id] = dispatcher_.dispatch_delayed(retryInterval_, [this, job] { tryStart(job); });
            return;
        }
    }
    runJob(job, ownsVm);
}

void ChallengeScheduler::runJob(const std::shared_ptr<Job>& job, bool ownsVm) {
    const auto id = job->session.id;
    ChallengeSession result;
    try {
        result = execute(job->session, job->def, job->flag);
    } catch (const std::exception& e) {
        BoostLogger::Error("Session {} failed outside the orchestrator: {}", id, e.what());
        result = failedSession(job->session, e.what());
    }

    if (ownsVm) {
        std::lock_guard lock(mutex_);
        busyVms_.erase(job->session.vmName);
    }

    if (job->done) {
        try {
            job->done(result);
        } catch (const std::exception& e) {
            BoostLogger::Error("Completion handler of session {} threw: {}", id, e.what());
        }
    }

    std::lock_guard lock(mutex_);
    jobs_.erase(id);
    if (jobs_.empty()) idle_.notify_all();
}

ChallengeSession ChallengeScheduler::execute(ChallengeSession session, const ChallengeDefinition& def,
                                             const CONCURRENCY::CancelFlag& flag) {
    auto orchestrator = factory_();
    if (!orchestrator) {
        throw std::runtime_error("orchestrator factory returned nothing");
    }
    if (CONCURRENCY::isCancelled(flag)) {
        orchestrator->cancel(session, def);
    } else if (session.isSuspended()) {
        orchestrator->resume(session, def, flag);
    } else {
        orchestrator->run(session, def, flag);
    }
    return session;
}

void ChallengeScheduler::cancel(const std::string& sessionId) {
    std::lock_guard lock(mutex_);
    if (auto it = jobs_.find(sessionId); it != jobs_.end()) {
        it->second->store(true);
        BoostLogger::Info("Cancellation requested for session {}", sessionId);
    }
}

void ChallengeScheduler::cancelAll() {
    std::lock_guard lock(mutex_);
    for (auto& [id, flag] : jobs_) flag->store(true);
}

void ChallengeScheduler::waitIdle() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return jobs_.empty(); });
}

std::size_t ChallengeScheduler::active() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}
