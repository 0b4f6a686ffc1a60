#pragma once
#include <string>
#include <string_view>
#include <filesystem>

namespace PathUtils {

// يوسّع "~" إلى مجلد المستخدم
[[nodiscard]] std::filesystem::path expandUser(std::string_view path);

// اقتباس آمن لقيمة داخل أمر shell
[[nodiscard]] std::string shellQuote(std::string_view value);

// المجلد الأب لمسار بعيد بصيغة POSIX ("/" للجذر، "." للمسار النسبي)
[[nodiscard]] std::string remoteParent(std::string_view remotePath);

} // namespace PathUtils
