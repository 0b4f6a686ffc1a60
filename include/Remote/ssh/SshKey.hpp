#pragma once
#include <filesystem>
#include <string_view>

namespace SshKey {

/**
 * @brief Resolves "~" and checks that the private key is a regular file.
 *
 * Group/world permission bits are stripped (chmod 0600) with a warning.
 * Throws KeyError when the key is absent or not a regular file.
 */
[[nodiscard]] std::filesystem::path validate(std::string_view path);

// أي من بتات 0077
[[nodiscard]] bool isTooOpen(std::filesystem::perms perms) noexcept;

} // namespace SshKey
