#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Challenge/ChallengeSteps.hpp"
#include "Utils/Exception.hpp"

enum class ChallengePhase {
    Loaded,
    SnapshotCreated,
    VMReady,
    SetupComplete,
    Simulated,
    AwaitingUserAction,
    Validated,
    CleanedUp,
    Done,
    Aborted
};

[[nodiscard]] std::string_view toString(ChallengePhase phase) noexcept;
[[nodiscard]] std::optional<ChallengePhase> phaseFromString(std::string_view name) noexcept;
[[nodiscard]] bool isTerminal(ChallengePhase phase) noexcept;

struct RunOptions {
    bool simulate{false};
    bool keepSnapshot{false};
};

// SnapshotCreated
struct SnapshotRecord {
    std::string name;
    bool vmWasRunning{false};
    bool created{false};
};

// VMReady
struct GuestEndpoint {
    std::string ip;
};

// Simulated / AwaitingUserAction
struct UserActionRecord {
    bool simulated{false};
    std::optional<StepOutcome> outcome;
};

// Validated
struct ValidationReport {
    bool passed{false};
    int score{0};
    std::optional<StepOutcome> failingStep;
};

// CleanedUp
struct CleanupRecord {
    bool snapshotKept{false};
    bool reverted{false};
    bool deleted{false};
    std::string deleteMessage;
    std::vector<std::string> warnings;
};

// Aborted
struct FailureRecord {
    std::optional<ErrorKind> kind;   // فارغ عند فشل خطوة عادي
    ChallengePhase phase{ChallengePhase::Loaded};
    std::string message;
    std::optional<StepOutcome> step;
    bool cancelled{false};
};

struct RunReport {
    bool success{false};
    std::string message;
    int stepsCompleted{0};
    int totalSteps{0};
    double executionTimeSeconds{0.0};
};

/**
 * @brief Mutable state of one challenge run.
 *
 * Each phase fills its own record; the records of earlier phases stay
 * available to later ones (cleanup needs the snapshot record).
 */
struct ChallengeSession {
    std::string id;
    std::string challengeId;
    std::string challengeSource;
    std::string vmName;
    RunOptions options;
    ChallengePhase phase{ChallengePhase::Loaded};

    std::optional<SnapshotRecord> snapshot;
    std::optional<GuestEndpoint> guest;
    std::vector<StepOutcome> setupResults;
    std::optional<UserActionRecord> userAction;
    std::vector<StepOutcome> validationResults;
    std::optional<ValidationReport> verdict;
    std::optional<CleanupRecord> cleanup;
    std::optional<FailureRecord> failure;
    std::optional<RunReport> report;

    std::int64_t startedAt{0};
    double activeSeconds{0.0};

    [[nodiscard]] bool isTerminal() const noexcept { return ::isTerminal(phase); }
    [[nodiscard]] bool isSuspended() const noexcept { return phase == ChallengePhase::AwaitingUserAction; }
    // ملخص مقروء للحالة النهائية
    [[nodiscard]] std::string summary() const;
};
