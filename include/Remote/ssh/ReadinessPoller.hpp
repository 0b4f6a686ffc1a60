#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "Core/concurrency/CancelFlag.hpp"
#include "Remote/ssh/SshTypes.hpp"

/**
 * @brief Bounded probe loop with a fixed poll interval.
 *
 * The probe receives its per-attempt timeout and returns std::nullopt on
 * success or the cause of the failure.
 */
class ReadinessPoller {
public:
    using Probe = std::function<std::optional<SshFailure>(std::chrono::milliseconds attemptTimeout)>;

    ReadinessPoller(std::chrono::milliseconds totalTimeout, std::chrono::milliseconds pollInterval);

    [[nodiscard]] bool run(const Probe& probe, const std::string& label,
                           const CONCURRENCY::CancelFlag& cancel = nullptr) const;

    // max(1s, poll - 1s)
    [[nodiscard]] static std::chrono::milliseconds attemptTimeout(std::chrono::milliseconds pollInterval) noexcept;

private:
    std::chrono::milliseconds total;
    std::chrono::milliseconds poll;

    // نوم قابل للمقاطعة بالإلغاء
    [[nodiscard]] static bool sleepFor(std::chrono::milliseconds duration, const CONCURRENCY::CancelFlag& cancel);
};
