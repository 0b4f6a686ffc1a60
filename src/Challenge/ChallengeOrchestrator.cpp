#include "Challenge/ChallengeOrchestrator.hpp"
#include "Utils/Logger.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <fmt/format.h>

using namespace std::chrono_literals;

namespace {

// خطوة فشلت (كود خروج أو خطأ نقل)
class StepFailed : public std::runtime_error {
public:
    StepFailed(std::optional<ErrorKind> kind, const std::string& msg, StepOutcome outcome)
        : std::runtime_error(msg), kind(kind), outcome(std::move(outcome)) {}

    std::optional<ErrorKind> kind;
    StepOutcome outcome;
};

class RunCancelled : public std::runtime_error {
public:
    RunCancelled() : std::runtime_error("cancelled") {}
};

ErrorKind transportKind(SshFailureKind kind) noexcept {
    switch (kind) {
        case SshFailureKind::Auth:    return ErrorKind::Auth;
        case SshFailureKind::Timeout: return ErrorKind::Timeout;
        default:                      return ErrorKind::Network;
    }
}

void throwIfCancelled(const CONCURRENCY::CancelFlag& cancel) {
    if (CONCURRENCY::isCancelled(cancel)) throw RunCancelled();
}

void sleepOrCancel(std::chrono::milliseconds duration, const CONCURRENCY::CancelFlag& cancel) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        throwIfCancelled(cancel);
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(until - std::chrono::steady_clock::now(), 100ms));
    }
}

StepOutcome outcomeFor(int index, std::string kind, std::string description, std::string command,
                       const CommandResult& result) {
    StepOutcome out;
    out.index = index;
    out.kind = std::move(kind);
    out.description = std::move(description);
    out.command = std::move(command);
    out.exitCode = result.exitCode;
    out.stdoutText = result.stdoutText;
    out.stderrText = result.stderrText;
    if (result.error) {
        out.reason = fmt::format("{} error: {}", toString(result.error->kind), result.error->message);
    }
    return out;
}

} // namespace

OrchestratorSettings OrchestratorSettings::fromConfig(const LabConfig& cfg) {
    OrchestratorSettings s;
    s.uri = cfg.hypervisor.uri;
    s.ssh = cfg.ssh;
    s.readiness = cfg.readiness;
    s.snapshot = cfg.snapshot;
    s.shutdownTimeout = cfg.hypervisor.shutdownTimeout;
    return s;
}

ChallengeOrchestrator::ChallengeOrchestrator(HypervisorSessionFactory factory,
                                             std::shared_ptr<IRemoteExecutor> ssh,
                                             OrchestratorSettings settings)
    : factory_(std::move(factory)), ssh_(std::move(ssh)), settings_(std::move(settings)) {}

ChallengeOrchestrator::~ChallengeOrchestrator() {
    releaseHypervisor();
}

std::string ChallengeOrchestrator::snapshotNameFor(const std::string& prefix, const std::string& challengeId,
                                                   const std::string& sessionId) {
    return fmt::format("{}-{}-{}", prefix, challengeId, sessionId.substr(0, 8));
}

bool ChallengeOrchestrator::isValidTransition(ChallengePhase from, ChallengePhase to) noexcept {
    if (isTerminal(from)) return false;
    if (to == ChallengePhase::Aborted) return true;

    switch (from) {
        case ChallengePhase::Loaded:             return to == ChallengePhase::SnapshotCreated;
        case ChallengePhase::SnapshotCreated:    return to == ChallengePhase::VMReady;
        case ChallengePhase::VMReady:            return to == ChallengePhase::SetupComplete;
        case ChallengePhase::SetupComplete:
            return to == ChallengePhase::Simulated || to == ChallengePhase::AwaitingUserAction;
        case ChallengePhase::Simulated:
        case ChallengePhase::AwaitingUserAction: return to == ChallengePhase::Validated;
        case ChallengePhase::Validated:          return to == ChallengePhase::CleanedUp;
        case ChallengePhase::CleanedUp:          return to == ChallengePhase::Done;
        default:                                 return false;
    }
}

ChallengeSession ChallengeOrchestrator::createSession(const ChallengeDefinition& def, const std::string& vm,
                                                      const RunOptions& options) const {
    ChallengeSession session;
    session.id = boost::uuids::to_string(boost::uuids::random_generator()());
    session.challengeId = def.id;
    session.challengeSource = def.sourcePath;
    session.vmName = vm;
    session.options = options;
    session.startedAt = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    BoostLogger::Info("Session {} created for challenge '{}' on '{}' (simulate={}, keep_snapshot={})",
                      session.id, def.id, vm, options.simulate, options.keepSnapshot);
    return session;
}

IHypervisorSession& ChallengeOrchestrator::hypervisor() {
    if (!hypervisor_ || !hypervisor_->isOpen()) {
        hypervisor_ = factory_(settings_.uri);
        if (!hypervisor_) {
            throw ConnectionError("no hypervisor session for " + settings_.uri);
        }
    }
    return *hypervisor_;
}

void ChallengeOrchestrator::releaseHypervisor() noexcept {
    if (hypervisor_) {
        hypervisor_->close();
        hypervisor_.reset();
    }
}

SshTarget ChallengeOrchestrator::targetFor(const ChallengeSession& session) const {
    SshTarget target;
    target.host = session.guest ? session.guest->ip : std::string{};
    target.user = settings_.ssh.user;
    target.keyPath = settings_.ssh.keyPath;
    target.port = settings_.ssh.port;
    return target;
}

void ChallengeOrchestrator::enter(ChallengeSession& session, ChallengePhase next) {
    if (!isValidTransition(session.phase, next)) {
        throw std::logic_error(fmt::format("invalid phase transition {} -> {}", toString(session.phase), toString(next)));
    }
    BoostLogger::Debug("Session {}: {} -> {}", session.id, toString(session.phase), toString(next));
    session.phase = next;
}

void ChallengeOrchestrator::createSnapshot(ChallengeSession& session, const ChallengeDefinition& def) {
    if (def.id.empty()) throw InvalidDefinitionError("id", "missing required key");
    if (def.name.empty()) throw InvalidDefinitionError("name", "missing required key");
    if (def.description.empty()) throw InvalidDefinitionError("description", "missing required key");

    auto& hv = hypervisor();
    SnapshotRecord record;
    record.name = snapshotNameFor(settings_.snapshot.prefix, def.id, session.id);
    record.vmWasRunning = hv.runState(session.vmName) == RunState::Running;
    session.snapshot = record;

    try {
        hv.snapshots().createExternal(session.vmName, record.name,
                                      fmt::format("Pre-challenge snapshot for '{}' (session {})", def.id, session.id),
                                      settings_.snapshot.freezeFs);
        session.snapshot->created = true;
    } catch (const SnapshotOperationError&) {
        // قد يكون المشرف قد قبل اللقطة رغم فشل التحقق
        try {
            const auto snapshots = hv.snapshots().list(session.vmName);
            session.snapshot->created = std::any_of(snapshots.begin(), snapshots.end(),
                [&](const SnapshotInfo& s) { return s.name == record.name; });
        } catch (const LabException& e) {
            BoostLogger::Warn("Session {}: cannot list snapshots after failed create: {}", session.id, e.what());
        }
        throw;
    }
    enter(session, ChallengePhase::SnapshotCreated);
}

void ChallengeOrchestrator::prepareVm(ChallengeSession& session, const CONCURRENCY::CancelFlag& cancel) {
    auto& hv = hypervisor();
    hv.ensureRunning(session.vmName);

    const auto deadline = std::chrono::steady_clock::now() + settings_.readiness.timeout;
    std::optional<std::string> ip;
    while (true) {
        throwIfCancelled(cancel);
        ip = hv.getIP(session.vmName);
        if (ip) break;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms) {
            throw TimeoutError(fmt::format("'{}' reported no IPv4 address within {}s",
                                           session.vmName, settings_.readiness.timeout.count()));
        }
        BoostLogger::Debug("Session {}: no IP for '{}' yet", session.id, session.vmName);
        sleepOrCancel(std::min<std::chrono::milliseconds>(settings_.readiness.pollInterval, remaining), cancel);
    }
    session.guest = GuestEndpoint{*ip};
    BoostLogger::Info("Session {}: '{}' has IP {}", session.id, session.vmName, *ip);

    const auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - std::chrono::steady_clock::now());
    const auto budget = std::max(left, settings_.readiness.pollInterval);
    if (!ssh_->waitUntilReady(targetFor(session), budget, settings_.readiness.pollInterval, cancel)) {
        throwIfCancelled(cancel);
        throw TimeoutError(fmt::format("SSH on {} not ready within {}s", *ip, settings_.readiness.timeout.count()));
    }
    enter(session, ChallengePhase::VMReady);
}

void ChallengeOrchestrator::runSetup(ChallengeSession& session, const ChallengeDefinition& def) {
    const auto target = targetFor(session);
    session.setupResults.clear();

    for (std::size_t i = 0; i < def.setup.size(); ++i) {
        const auto& step = def.setup[i];
        const int index = static_cast<int>(i);
        BoostLogger::Info("Session {}: setup step {}/{}: {}", session.id, i + 1, def.setup.size(), step.summary());

        StepOutcome out;
        if (step.type == SetupStepType::RunCommand) {
            const auto result = ssh_->runCommand(target, step.command, settings_.ssh.commandTimeout, std::nullopt);
            out = outcomeFor(index, "run_command", step.summary(), step.command, result);
            if (result.error) {
                throw StepFailed(transportKind(result.error->kind),
                                 fmt::format("setup step {} could not run: {}", i + 1, result.error->message), out);
            }
            out.passed = *result.exitCode == step.expectedExitCode;
            if (!out.passed) {
                out.reason = fmt::format("exit code {} (expected {})", *result.exitCode, step.expectedExitCode);
                if (auto err = boost::algorithm::trim_copy(result.stderrText); !err.empty()) out.reason += ": " + err;
            }
        } else {
            out.index = index;
            out.kind = "copy_file";
            out.description = step.summary();
            out.command = fmt::format("copy {} {}", step.localPath, step.remotePath);
            out.passed = ssh_->copyFile(target, step.localPath, step.remotePath, step.createDirs);
            if (!out.passed) out.reason = "file transfer failed";
        }

        session.setupResults.push_back(out);
        if (!out.passed) {
            throw StepFailed(std::nullopt, fmt::format("setup step {} failed: {}", i + 1, out.reason), out);
        }
    }
    enter(session, ChallengePhase::SetupComplete);
}

void ChallengeOrchestrator::performUserAction(ChallengeSession& session, const ChallengeDefinition& def) {
    if (!session.options.simulate) {
        session.userAction = UserActionRecord{false, std::nullopt};
        enter(session, ChallengePhase::AwaitingUserAction);
        releaseHypervisor();
        BoostLogger::Info("Session {}: waiting for the user action on '{}'", session.id, session.vmName);
        return;
    }

    UserActionRecord record{true, std::nullopt};
    if (def.userActionSimulation.empty()) {
        BoostLogger::Warn("Session {}: challenge '{}' has no user action simulation, validating as is", session.id, def.id);
    } else {
        const auto result = ssh_->runCommand(targetFor(session), def.userActionSimulation,
                                             settings_.ssh.commandTimeout, std::nullopt);
        auto out = outcomeFor(-1, "user_action_simulation", "simulated user action", def.userActionSimulation, result);
        if (result.error) {
            throw StepFailed(transportKind(result.error->kind),
                             "simulated user action could not run: " + result.error->message, out);
        }
        out.passed = *result.exitCode == 0;
        if (!out.passed) {
            out.reason = fmt::format("exit code {}", *result.exitCode);
            BoostLogger::Warn("Session {}: simulated user action exited {}", session.id, *result.exitCode);
        }
        record.outcome = out;
    }
    session.userAction = record;
    enter(session, ChallengePhase::Simulated);
}

void ChallengeOrchestrator::validate(ChallengeSession& session, const ChallengeDefinition& def) {
    if (session.phase == ChallengePhase::AwaitingUserAction) {
        // العنوان قد يتغير أثناء التوقف الطويل
        try {
            if (auto ip = hypervisor().getIP(session.vmName)) {
                session.guest = GuestEndpoint{*ip};
            }
        } catch (const LabException& e) {
            if (e.kind() == ErrorKind::Connection || e.kind() == ErrorKind::NotFound) throw;
            BoostLogger::Warn("Session {}: IP refresh failed, using {}: {}", session.id,
                              session.guest ? session.guest->ip : "none", e.what());
        }
    }

    const auto target = targetFor(session);
    session.validationResults.clear();
    std::optional<StepOutcome> failing;

    if (def.validation.empty()) {
        BoostLogger::Warn("Session {}: challenge '{}' has no validation steps", session.id, def.id);
    }

    for (std::size_t i = 0; i < def.validation.size(); ++i) {
        const auto& step = def.validation[i];
        const auto command = step.buildCommand();
        const auto result = ssh_->runCommand(target, command, settings_.ssh.commandTimeout, std::nullopt);
        if (result.error) {
            auto out = outcomeFor(static_cast<int>(i), std::string(toString(step.type)), step.description, command, result);
            throw StepFailed(transportKind(result.error->kind),
                             fmt::format("validation step {} could not run: {}", i + 1, result.error->message), out);
        }

        auto out = step.evaluate(result);
        out.index = static_cast<int>(i);
        BoostLogger::Info("Session {}: validation {}/{} {} ({}){}", session.id, i + 1, def.validation.size(),
                          out.passed ? "passed" : "FAILED", out.kind, out.passed ? "" : ": " + out.reason);
        if (!out.passed && !failing) {
            failing = out;
        }
        session.validationResults.push_back(std::move(out));
    }

    ValidationReport report;
    report.passed = !failing.has_value();
    report.score = report.passed ? def.score : 0;
    report.failingStep = std::move(failing);
    session.verdict = std::move(report);
    enter(session, ChallengePhase::Validated);
}

void ChallengeOrchestrator::restoreSnapshot(ChallengeSession& session, CleanupRecord& record) {
    const auto& snap = *session.snapshot;
    auto warn = [&](const std::string& what, const std::exception& e) {
        const auto text = fmt::format("{}: {}", what, e.what());
        BoostLogger::Warn("Session {}: cleanup: {}", session.id, text);
        record.warnings.push_back(text);
    };

    IHypervisorSession* hv = nullptr;
    try {
        hv = &hypervisor();
    } catch (const LabException& e) {
        warn("cannot reach hypervisor", e);
        return;
    }

    try {
        hv->snapshots().revert(session.vmName, snap.name);
        record.reverted = true;
    } catch (const NotFoundError& e) {
        BoostLogger::Info("Session {}: snapshot '{}' already gone, nothing to revert", session.id, snap.name);
    } catch (const LabException& e) {
        warn("revert to " + snap.name, e);
    }

    try {
        const auto outcome = hv->snapshots().remove(session.vmName, snap.name);
        record.deleted = outcome.metadataRemoved;
        record.deleteMessage = outcome.message;
    } catch (const NotFoundError& e) {
        BoostLogger::Info("Session {}: snapshot '{}' already deleted", session.id, snap.name);
    } catch (const LabException& e) {
        warn("delete of " + snap.name, e);
    }

    try {
        if (snap.vmWasRunning) {
            hv->ensureRunning(session.vmName);
        } else if (hv->runState(session.vmName) == RunState::Running) {
            hv->powerOff(session.vmName, settings_.shutdownTimeout);
        }
    } catch (const LabException& e) {
        warn("restore power state of " + session.vmName, e);
    }
}

void ChallengeOrchestrator::cleanUp(ChallengeSession& session) {
    CleanupRecord record;
    if (session.options.keepSnapshot) {
        record.snapshotKept = true;
        BoostLogger::Info("Session {}: keeping snapshot '{}'", session.id,
                          session.snapshot ? session.snapshot->name : "none");
    } else if (session.snapshot && session.snapshot->created) {
        restoreSnapshot(session, record);
    }
    session.cleanup = std::move(record);
    enter(session, ChallengePhase::CleanedUp);
}

void ChallengeOrchestrator::finish(ChallengeSession& session, const ChallengeDefinition& def) {
    releaseHypervisor();
    enter(session, ChallengePhase::Done);
    session.report = buildReport(session, def);
    BoostLogger::Info("{}", session.summary());
}

void ChallengeOrchestrator::abort(ChallengeSession& session, const ChallengeDefinition& def, FailureRecord failure) {
    BoostLogger::Error("Session {}: aborting in {}: {}", session.id, toString(session.phase), failure.message);

    CleanupRecord record = session.cleanup.value_or(CleanupRecord{});
    const bool alreadyCleaned = session.phase == ChallengePhase::CleanedUp;
    if (!alreadyCleaned && session.snapshot && session.snapshot->created) {
        if (session.options.keepSnapshot) {
            record.snapshotKept = true;
        } else {
            restoreSnapshot(session, record);
        }
    }
    session.cleanup = std::move(record);
    session.failure = std::move(failure);
    session.phase = ChallengePhase::Aborted;
    releaseHypervisor();
    session.report = buildReport(session, def);
    BoostLogger::Error("{}", session.summary());
}

RunReport ChallengeOrchestrator::buildReport(const ChallengeSession& session, const ChallengeDefinition& def) const {
    RunReport report;
    report.totalSteps = static_cast<int>(def.setup.size() + def.validation.size());
    auto passed = [](const StepOutcome& o) { return o.passed; };
    report.stepsCompleted = static_cast<int>(
        std::count_if(session.setupResults.begin(), session.setupResults.end(), passed) +
        std::count_if(session.validationResults.begin(), session.validationResults.end(), passed));
    report.success = session.phase == ChallengePhase::Done && session.verdict && session.verdict->passed;
    report.message = session.summary();
    report.executionTimeSeconds = session.activeSeconds;
    return report;
}

bool ChallengeOrchestrator::advance(ChallengeSession& session, const ChallengeDefinition& def,
                                    const CONCURRENCY::CancelFlag& cancel) {
    if (session.isTerminal() || session.isSuspended()) return false;
    if (session.challengeId != def.id) {
        throw std::invalid_argument(fmt::format("session {} belongs to challenge '{}', not '{}'",
                                                session.id, session.challengeId, def.id));
    }

    const auto started = std::chrono::steady_clock::now();
    const auto phase = session.phase;
    try {
        throwIfCancelled(cancel);
        switch (phase) {
            case ChallengePhase::Loaded:          createSnapshot(session, def); break;
            case ChallengePhase::SnapshotCreated: prepareVm(session, cancel); break;
            case ChallengePhase::VMReady:         runSetup(session, def); break;
            case ChallengePhase::SetupComplete:   performUserAction(session, def); break;
            case ChallengePhase::Simulated:       validate(session, def); break;
            case ChallengePhase::Validated:       cleanUp(session); break;
            case ChallengePhase::CleanedUp:       finish(session, def); break;
            default: break;
        }
    } catch (const RunCancelled&) {
        abort(session, def, FailureRecord{std::nullopt, phase, "cancelled", std::nullopt, true});
    } catch (const StepFailed& e) {
        abort(session, def, FailureRecord{e.kind, phase, e.what(), e.outcome, false});
    } catch (const LabException& e) {
        abort(session, def, FailureRecord{e.kind(), phase, e.what(), std::nullopt, false});
    } catch (const std::exception& e) {
        abort(session, def, FailureRecord{std::nullopt, phase, e.what(), std::nullopt, false});
    }

    session.activeSeconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (session.report) {
        session.report->executionTimeSeconds = session.activeSeconds;
    }
    return !session.isTerminal() && !session.isSuspended();
}

void ChallengeOrchestrator::drive(ChallengeSession& session, const ChallengeDefinition& def,
                                  const CONCURRENCY::CancelFlag& cancel) {
    while (advance(session, def, cancel)) {
    }
}

void ChallengeOrchestrator::run(ChallengeSession& session, const ChallengeDefinition& def,
                                const CONCURRENCY::CancelFlag& cancel) {
    drive(session, def, cancel);
}

void ChallengeOrchestrator::resume(ChallengeSession& session, const ChallengeDefinition& def,
                                   const CONCURRENCY::CancelFlag& cancel) {
    if (!session.isSuspended()) {
        throw std::invalid_argument(fmt::format("session {} is not awaiting a user action (phase {})",
                                                session.id, toString(session.phase)));
    }
    if (session.challengeId != def.id) {
        throw std::invalid_argument(fmt::format("session {} belongs to challenge '{}', not '{}'",
                                                session.id, session.challengeId, def.id));
    }
    BoostLogger::Info("Session {}: continue signal received", session.id);

    const auto started = std::chrono::steady_clock::now();
    try {
        throwIfCancelled(cancel);
        validate(session, def);
    } catch (const RunCancelled&) {
        abort(session, def, FailureRecord{std::nullopt, ChallengePhase::AwaitingUserAction, "cancelled", std::nullopt, true});
    } catch (const StepFailed& e) {
        abort(session, def, FailureRecord{e.kind, ChallengePhase::AwaitingUserAction, e.what(), e.outcome, false});
    } catch (const LabException& e) {
        abort(session, def, FailureRecord{e.kind(), ChallengePhase::AwaitingUserAction, e.what(), std::nullopt, false});
    } catch (const std::exception& e) {
        abort(session, def, FailureRecord{std::nullopt, ChallengePhase::AwaitingUserAction, e.what(), std::nullopt, false});
    }
    session.activeSeconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    drive(session, def, cancel);
}

void ChallengeOrchestrator::cancel(ChallengeSession& session, const ChallengeDefinition& def) {
    if (session.isTerminal()) return;
    BoostLogger::Warn("Session {}: cancelled in {}", session.id, toString(session.phase));
    abort(session, def, FailureRecord{std::nullopt, session.phase, "cancelled by user", std::nullopt, true});
}
