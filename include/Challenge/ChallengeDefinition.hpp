#pragma once
#include <string>
#include <vector>
#include "Challenge/ChallengeSteps.hpp"

struct Hint {
    std::string text;
    int cost{0};
};

/**
 * @brief Read-only challenge description loaded from YAML.
 */
struct ChallengeDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    std::string difficulty;
    int score{100};
    std::vector<std::string> concepts;

    std::vector<SetupStep> setup;
    std::string userActionSimulation;
    std::vector<ValidationStep> validation;

    std::vector<Hint> hints;
    std::string flag;

    bool simulate{false};
    bool keepSnapshot{false};

    std::string sourcePath;
};
