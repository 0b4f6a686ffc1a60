#include "Challenge/SessionStore.hpp"
#include "Utils/Logger.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace {

constexpr std::array kErrorKinds{
    ErrorKind::Connection, ErrorKind::NotFound, ErrorKind::Key, ErrorKind::Auth, ErrorKind::Timeout,
    ErrorKind::SnapshotOperation, ErrorKind::InvalidDefinition, ErrorKind::AgentCommand, ErrorKind::Network,
};

std::optional<ErrorKind> errorKindFromString(const std::string& name) {
    for (auto kind : kErrorKinds) {
        if (toString(kind) == name) return kind;
    }
    return std::nullopt;
}

std::string keyFor(std::string_view id) {
    return std::string(SessionStore::kKeyPrefix) + std::string(id);
}

using nlohmann::json;

json toJson(const StepOutcome& o) {
    json v = {
        {"index", o.index},
        {"kind", o.kind},
        {"description", o.description},
        {"command", o.command},
        {"passed", o.passed},
        {"stdout", o.stdoutText},
        {"stderr", o.stderrText},
        {"reason", o.reason},
    };
    if (o.exitCode) v["exit_code"] = *o.exitCode;
    return v;
}

StepOutcome outcomeFromJson(const json& v) {
    StepOutcome o;
    o.index = v.value("index", 0);
    o.kind = v.value("kind", "");
    o.description = v.value("description", "");
    o.command = v.value("command", "");
    o.passed = v.value("passed", false);
    if (v.contains("exit_code")) o.exitCode = v.at("exit_code").get<int>();
    o.stdoutText = v.value("stdout", "");
    o.stderrText = v.value("stderr", "");
    o.reason = v.value("reason", "");
    return o;
}

json toJson(const std::vector<StepOutcome>& outcomes) {
    json arr = json::array();
    for (const auto& o : outcomes) arr.push_back(toJson(o));
    return arr;
}

std::vector<StepOutcome> outcomesFromJson(const json& root, const char* key) {
    std::vector<StepOutcome> out;
    const auto it = root.find(key);
    if (it == root.end() || !it->is_array()) return out;
    for (const auto& item : *it) out.push_back(outcomeFromJson(item));
    return out;
}

ChallengeSession fromJson(const json& root) {
    ChallengeSession s;
    s.id = root.value("id", "");
    s.challengeId = root.value("challenge_id", "");
    if (s.id.empty() || s.challengeId.empty()) {
        throw std::invalid_argument("session JSON lacks id or challenge_id");
    }
    s.challengeSource = root.value("challenge_source", "");
    s.vmName = root.value("vm", "");
    s.options.simulate = root.value("simulate", false);
    s.options.keepSnapshot = root.value("keep_snapshot", false);

    const auto phaseName = root.value("phase", "");
    const auto phase = phaseFromString(phaseName);
    if (!phase) {
        throw std::invalid_argument("unknown phase '" + phaseName + "'");
    }
    s.phase = *phase;
    s.startedAt = root.value("started_at", std::int64_t{0});
    s.activeSeconds = root.value("active_seconds", 0.0);

    if (root.contains("snapshot")) {
        const auto& snap = root.at("snapshot");
        s.snapshot = SnapshotRecord{snap.value("name", ""), snap.value("vm_was_running", false),
                                    snap.value("created", false)};
    }
    if (root.contains("guest_ip")) s.guest = GuestEndpoint{root.at("guest_ip").get<std::string>()};
    s.setupResults = outcomesFromJson(root, "setup_results");
    if (root.contains("user_action")) {
        const auto& ua = root.at("user_action");
        UserActionRecord record{ua.value("simulated", false), std::nullopt};
        if (ua.contains("outcome")) record.outcome = outcomeFromJson(ua.at("outcome"));
        s.userAction = record;
    }
    s.validationResults = outcomesFromJson(root, "validation_results");
    if (root.contains("verdict")) {
        const auto& v = root.at("verdict");
        ValidationReport verdict{v.value("passed", false), v.value("score", 0), std::nullopt};
        if (v.contains("failing_step")) verdict.failingStep = outcomeFromJson(v.at("failing_step"));
        s.verdict = verdict;
    }
    if (root.contains("cleanup")) {
        const auto& c = root.at("cleanup");
        CleanupRecord record;
        record.snapshotKept = c.value("snapshot_kept", false);
        record.reverted = c.value("reverted", false);
        record.deleted = c.value("deleted", false);
        record.deleteMessage = c.value("delete_message", "");
        record.warnings = c.value("warnings", std::vector<std::string>{});
        s.cleanup = record;
    }
    if (root.contains("failure")) {
        const auto& f = root.at("failure");
        FailureRecord failure;
        if (f.contains("kind")) failure.kind = errorKindFromString(f.at("kind").get<std::string>());
        failure.phase = phaseFromString(f.value("phase", "")).value_or(ChallengePhase::Loaded);
        failure.message = f.value("message", "");
        if (f.contains("step")) failure.step = outcomeFromJson(f.at("step"));
        failure.cancelled = f.value("cancelled", false);
        s.failure = failure;
    }
    if (root.contains("report")) {
        const auto& r = root.at("report");
        RunReport report;
        report.success = r.value("success", false);
        report.message = r.value("message", "");
        report.stepsCompleted = r.value("steps_completed", 0);
        report.totalSteps = r.value("total_steps", 0);
        report.executionTimeSeconds = r.value("execution_time", 0.0);
        s.report = report;
    }
    return s;
}

} // namespace

SessionStore::SessionStore(std::shared_ptr<IRocksDB> db) : db_(std::move(db)) {}

std::string SessionStore::serialize(const ChallengeSession& s) {
    json root = {
        {"id", s.id},
        {"challenge_id", s.challengeId},
        {"challenge_source", s.challengeSource},
        {"vm", s.vmName},
        {"simulate", s.options.simulate},
        {"keep_snapshot", s.options.keepSnapshot},
        {"phase", std::string(toString(s.phase))},
        {"started_at", static_cast<std::int64_t>(s.startedAt)},
        {"active_seconds", s.activeSeconds},
        {"setup_results", toJson(s.setupResults)},
        {"validation_results", toJson(s.validationResults)},
    };

    if (s.snapshot) {
        root["snapshot"] = {
            {"name", s.snapshot->name},
            {"vm_was_running", s.snapshot->vmWasRunning},
            {"created", s.snapshot->created},
        };
    }
    if (s.guest) root["guest_ip"] = s.guest->ip;
    if (s.userAction) {
        json& ua = root["user_action"];
        ua["simulated"] = s.userAction->simulated;
        if (s.userAction->outcome) ua["outcome"] = toJson(*s.userAction->outcome);
    }
    if (s.verdict) {
        json& verdict = root["verdict"];
        verdict["passed"] = s.verdict->passed;
        verdict["score"] = s.verdict->score;
        if (s.verdict->failingStep) verdict["failing_step"] = toJson(*s.verdict->failingStep);
    }
    if (s.cleanup) {
        root["cleanup"] = {
            {"snapshot_kept", s.cleanup->snapshotKept},
            {"reverted", s.cleanup->reverted},
            {"deleted", s.cleanup->deleted},
            {"delete_message", s.cleanup->deleteMessage},
            {"warnings", s.cleanup->warnings},
        };
    }
    if (s.failure) {
        json& f = root["failure"];
        if (s.failure->kind) f["kind"] = std::string(toString(*s.failure->kind));
        f["phase"] = std::string(toString(s.failure->phase));
        f["message"] = s.failure->message;
        if (s.failure->step) f["step"] = toJson(*s.failure->step);
        f["cancelled"] = s.failure->cancelled;
    }
    if (s.report) {
        root["report"] = {
            {"success", s.report->success},
            {"message", s.report->message},
            {"steps_completed", s.report->stepsCompleted},
            {"total_steps", s.report->totalSteps},
            {"execution_time", s.report->executionTimeSeconds},
        };
    }
    return root.dump();
}

std::expected<ChallengeSession, std::string> SessionStore::deserialize(std::string_view text) {
    try {
        const auto root = json::parse(text);
        if (!root.is_object()) {
            return std::unexpected(std::string("invalid session JSON: not an object"));
        }
        return fromJson(root);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid session JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<void, std::string> SessionStore::save(const ChallengeSession& session) {
    auto result = db_->Put(keyFor(session.id), serialize(session));
    if (!result) {
        return std::unexpected("cannot save session " + session.id + ": " + result.error().ToString());
    }
    BoostLogger::Debug("Session {} saved in phase {}", session.id, toString(session.phase));
    return {};
}

std::expected<ChallengeSession, std::string> SessionStore::load(const std::string& id) const {
    auto raw = db_->Get(keyFor(id));
    if (!raw) {
        if (raw.error().IsNotFound()) return std::unexpected("no session with id " + id);
        return std::unexpected("cannot read session " + id + ": " + raw.error().ToString());
    }
    return deserialize(*raw);
}

std::expected<void, std::string> SessionStore::remove(const std::string& id) {
    auto result = db_->Delete(keyFor(id));
    if (!result) {
        return std::unexpected("cannot delete session " + id + ": " + result.error().ToString());
    }
    return {};
}

std::expected<std::vector<ChallengeSession>, std::string> SessionStore::list() const {
    auto keys = db_->Keys(kKeyPrefix);
    if (!keys) {
        return std::unexpected("cannot list sessions: " + keys.error().ToString());
    }

    std::vector<ChallengeSession> sessions;
    for (const auto& key : *keys) {
        auto raw = db_->Get(key);
        if (!raw) {
            BoostLogger::Warn("Skipping session {}: {}", key, raw.error().ToString());
            continue;
        }
        auto session = deserialize(*raw);
        if (!session) {
            BoostLogger::Warn("Skipping session {}: {}", key, session.error());
            continue;
        }
        sessions.push_back(std::move(*session));
    }
    return sessions;
}
