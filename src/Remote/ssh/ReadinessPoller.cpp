#include "Remote/ssh/ReadinessPoller.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>
#include <thread>

using namespace std::chrono_literals;

ReadinessPoller::ReadinessPoller(std::chrono::milliseconds totalTimeout, std::chrono::milliseconds pollInterval)
    : total(totalTimeout), poll(std::max(pollInterval, 1ms)) {}

std::chrono::milliseconds ReadinessPoller::attemptTimeout(std::chrono::milliseconds pollInterval) noexcept {
    return std::max<std::chrono::milliseconds>(1s, pollInterval - 1s);
}

bool ReadinessPoller::sleepFor(std::chrono::milliseconds duration, const CONCURRENCY::CancelFlag& cancel) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (CONCURRENCY::isCancelled(cancel)) return false;
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(until - now, 100ms));
    }
}

bool ReadinessPoller::run(const Probe& probe, const std::string& label, const CONCURRENCY::CancelFlag& cancel) const {
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + total;
    const auto perAttempt = attemptTimeout(poll);
    int attempt = 0;

    BoostLogger::Info("Waiting up to {}ms for {} (poll {}ms)", total.count(), label, poll.count());

    while (true) {
        if (CONCURRENCY::isCancelled(cancel)) {
            BoostLogger::Warn("Readiness wait for {} cancelled after {} attempt(s)", label, attempt);
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms) break;

        ++attempt;
        const auto failure = probe(std::min(perAttempt, remaining));
        if (!failure) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            BoostLogger::Info("{} ready after {} attempt(s) ({}ms)", label, attempt, elapsed.count());
            return true;
        }
        BoostLogger::Warn("{} not ready, attempt {} failed ({}): {}", label, attempt, toString(failure->kind), failure->message);

        remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= 0ms) break;
        if (!sleepFor(std::min(poll, remaining), cancel)) {
            BoostLogger::Warn("Readiness wait for {} cancelled after {} attempt(s)", label, attempt);
            return false;
        }
    }

    BoostLogger::Error("{} not ready within {}ms ({} attempt(s))", label, total.count(), attempt);
    return false;
}
