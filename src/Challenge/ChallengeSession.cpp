#include "Challenge/ChallengeSession.hpp"
#include <array>
#include <utility>
#include <fmt/format.h>

namespace {

constexpr std::array<std::pair<ChallengePhase, std::string_view>, 10> kPhaseNames{{
    {ChallengePhase::Loaded, "Loaded"},
    {ChallengePhase::SnapshotCreated, "SnapshotCreated"},
    {ChallengePhase::VMReady, "VMReady"},
    {ChallengePhase::SetupComplete, "SetupComplete"},
    {ChallengePhase::Simulated, "Simulated"},
    {ChallengePhase::AwaitingUserAction, "AwaitingUserAction"},
    {ChallengePhase::Validated, "Validated"},
    {ChallengePhase::CleanedUp, "CleanedUp"},
    {ChallengePhase::Done, "Done"},
    {ChallengePhase::Aborted, "Aborted"},
}};

} // namespace

std::string_view toString(ChallengePhase phase) noexcept {
    for (const auto& [p, name] : kPhaseNames) {
        if (p == phase) return name;
    }
    return "Loaded";
}

std::optional<ChallengePhase> phaseFromString(std::string_view name) noexcept {
    for (const auto& [p, n] : kPhaseNames) {
        if (n == name) return p;
    }
    return std::nullopt;
}

bool isTerminal(ChallengePhase phase) noexcept {
    return phase == ChallengePhase::Done || phase == ChallengePhase::Aborted;
}

std::string ChallengeSession::summary() const {
    if (phase == ChallengePhase::Aborted && failure) {
        auto text = fmt::format("Challenge '{}' on '{}' aborted during {}: {}",
                                challengeId, vmName, toString(failure->phase), failure->message);
        if (failure->step) {
            text += fmt::format(" [step {} `{}`", failure->step->index + 1, failure->step->command);
            if (failure->step->exitCode) text += fmt::format(", exit {}", *failure->step->exitCode);
            text += "]";
        }
        return text;
    }
    if (phase == ChallengePhase::Done && verdict) {
        if (verdict->passed) {
            return fmt::format("Challenge '{}' on '{}' passed (score {})", challengeId, vmName, verdict->score);
        }
        auto text = fmt::format("Challenge '{}' on '{}' failed", challengeId, vmName);
        if (verdict->failingStep) {
            text += fmt::format(": step {} `{}`: {}", verdict->failingStep->index + 1,
                                verdict->failingStep->command, verdict->failingStep->reason);
        }
        return text;
    }
    if (phase == ChallengePhase::AwaitingUserAction) {
        return fmt::format("Challenge '{}' on '{}' is waiting for the user action (session {})", challengeId, vmName, id);
    }
    return fmt::format("Challenge '{}' on '{}' is in phase {}", challengeId, vmName, toString(phase));
}
