#include "Utils/PathUtils.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace PathUtils {

std::filesystem::path expandUser(std::string_view path) {
    if (path.empty() || path.front() != '~') {
        return std::filesystem::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user/... غير مدعوم، يُعاد كما هو
        return std::filesystem::path(path);
    }

    std::string home;
    if (const char* env = std::getenv("HOME"); env && *env) {
        home = env;
    } else if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        home = pw->pw_dir;
    } else {
        return std::filesystem::path(path);
    }
    return std::filesystem::path(home + std::string(path.substr(1)));
}

std::string shellQuote(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'') {
            out.append("'\\''");
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string remoteParent(std::string_view remotePath) {
    while (remotePath.size() > 1 && remotePath.back() == '/') {
        remotePath.remove_suffix(1);
    }
    const auto pos = remotePath.rfind('/');
    if (pos == std::string_view::npos) return ".";
    if (pos == 0) return "/";
    return std::string(remotePath.substr(0, pos));
}

} // namespace PathUtils
