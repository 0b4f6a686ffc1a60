#include "Remote/ssh/SshKey.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include "Utils/PathUtils.hpp"

namespace fs = std::filesystem;

namespace SshKey {

bool isTooOpen(fs::perms perms) noexcept {
    constexpr auto groupOrOthers = fs::perms::group_all | fs::perms::others_all;
    return (perms & groupOrOthers) != fs::perms::none;
}

fs::path validate(std::string_view path) {
    if (path.empty()) {
        throw KeyError("no SSH private key configured");
    }
    const auto resolved = PathUtils::expandUser(path);

    std::error_code ec;
    const auto status = fs::status(resolved, ec);
    if (ec || !fs::exists(status)) {
        throw KeyError("SSH private key not found: " + resolved.string());
    }
    if (!fs::is_regular_file(status)) {
        throw KeyError("SSH private key is not a regular file: " + resolved.string());
    }

    if (isTooOpen(status.permissions())) {
        BoostLogger::Warn("SSH key {} is accessible by group/others, restricting to 0600", resolved.string());
        fs::permissions(resolved, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) {
            BoostLogger::Warn("Could not fix permissions of {}: {}", resolved.string(), ec.message());
        }
    }
    return resolved;
}

} // namespace SshKey
