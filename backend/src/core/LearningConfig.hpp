#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

class LearningConfig {
public:
    std::vector<int> learning_steps{1, 10, 30};   // Minutes
    std::vector<int> relearning_steps{10};        // Minutes
    int graduating_interval = 1;                  // Days, GOOD out of the last step
    int easy_interval = 4;                        // Days, EASY out of learning
    int new_cards_per_day = 20;                   // Advisory, sessions only

    static LearningConfig defaults() { return LearningConfig(); }

    // Throws InvalidConfigError describing the first problem found.
    void validate() const;
    bool isValid() const;

    // key:value lines, steps as comma-separated minutes
    std::string serialize() const;
    // Parses into a fresh config and validates it. On any problem the
    // defaults are returned instead and a warning is logged.
    static LearningConfig deserialize(const std::string& data);

    bool operator==(const LearningConfig& other) const;
    bool operator!=(const LearningConfig& other) const { return !(*this == other); }
};

std::string stepsAsLine(const std::vector<int>& steps);
bool parseStepsLine(const std::string& line, std::vector<int>& out);
