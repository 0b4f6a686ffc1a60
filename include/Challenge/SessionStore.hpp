#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Challenge/ChallengeSession.hpp"
#include "Core/interfaces/IDatabase.hpp"

/**
 * @brief Persists challenge sessions as JSON documents under "session/<id>".
 *
 * Lets a session suspended in AwaitingUserAction be continued or
 * cancelled by a later process.
 */
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<IRocksDB> db);

    [[nodiscard]] std::expected<void, std::string> save(const ChallengeSession& session);
    [[nodiscard]] std::expected<ChallengeSession, std::string> load(const std::string& id) const;
    [[nodiscard]] std::expected<void, std::string> remove(const std::string& id);
    // الجلسات غير القابلة للقراءة تُسجل وتُتجاهل
    [[nodiscard]] std::expected<std::vector<ChallengeSession>, std::string> list() const;

    [[nodiscard]] static std::string serialize(const ChallengeSession& session);
    [[nodiscard]] static std::expected<ChallengeSession, std::string> deserialize(std::string_view text);

    static constexpr std::string_view kKeyPrefix{"session/"};

private:
    std::shared_ptr<IRocksDB> db_;
};
