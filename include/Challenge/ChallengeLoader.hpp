#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include "Challenge/ChallengeDefinition.hpp"

/**
 * @brief Parses challenge YAML into ChallengeDefinition.
 *
 * Malformed input raises InvalidDefinitionError naming the offending
 * field (for example "validation[1].path").
 */
class ChallengeLoader {
public:
    [[nodiscard]] static ChallengeDefinition fromYAML(const std::string& text, std::string_view source = "<memory>");
    [[nodiscard]] static ChallengeDefinition fromFile(const std::filesystem::path& path);

    // الملفات غير الصالحة تُسجَّل وتُتجاوز
    [[nodiscard]] static std::map<std::string, ChallengeDefinition> loadDirectory(const std::filesystem::path& dir);

    [[nodiscard]] static bool isValidId(std::string_view id);
};
