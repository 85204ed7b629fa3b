#include "LearningConfig.hpp"
#include "errors.hpp"
#include <sstream>
#include <cctype>

static std::string trimmed(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

std::string stepsAsLine(const std::vector<int>& steps) {
    std::ostringstream oss;
    for (size_t i = 0; i < steps.size(); ++i) {
        if (i) oss << ",";
        oss << steps[i];
    }
    return oss.str();
}

bool parseStepsLine(const std::string& line, std::vector<int>& out) {
    std::vector<int> steps;
    std::istringstream iss(line);
    std::string tok;
    while (std::getline(iss, tok, ',')) {
        tok = trimmed(tok);
        if (tok.empty()) continue;
        try {
            size_t used = 0;
            int v = std::stoi(tok, &used);
            if (used != tok.size()) return false;
            steps.push_back(v);
        }
        catch (const std::exception&) {
            return false;
        }
    }
    out = std::move(steps);
    return true;
}

void LearningConfig::validate() const {
    if (learning_steps.empty())
        throw InvalidConfigError("learning steps must not be empty");
    if (relearning_steps.empty())
        throw InvalidConfigError("relearning steps must not be empty");
    for (int s : learning_steps) {
        if (s <= 0) throw InvalidConfigError("learning step must be positive: " + std::to_string(s));
    }
    for (int s : relearning_steps) {
        if (s <= 0) throw InvalidConfigError("relearning step must be positive: " + std::to_string(s));
    }
    if (graduating_interval < 1)
        throw InvalidConfigError("graduating interval must be at least 1 day");
    if (easy_interval < 1)
        throw InvalidConfigError("easy interval must be at least 1 day");
    if (new_cards_per_day < 0)
        throw InvalidConfigError("new cards per day must not be negative");
}

bool LearningConfig::isValid() const {
    try {
        validate();
        return true;
    }
    catch (const InvalidConfigError& e) {
        spdlog::debug("LearningConfig invalid: {}", e.what());
        return false;
    }
}

std::string LearningConfig::serialize() const {
    std::ostringstream oss;
    oss << "learning_steps:" << stepsAsLine(learning_steps) << "\n"
        << "relearning_steps:" << stepsAsLine(relearning_steps) << "\n"
        << "graduating_interval:" << graduating_interval << "\n"
        << "easy_interval:" << easy_interval << "\n"
        << "new_cards_per_day:" << new_cards_per_day << "\n";
    return oss.str();
}

LearningConfig LearningConfig::deserialize(const std::string& data) {
    LearningConfig cfg;
    std::istringstream iss(data);
    std::string line;
    bool ok = true;

    while (ok && std::getline(iss, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;

        std::string key = trimmed(line.substr(0, pos));
        std::string val = trimmed(line.substr(pos + 1));
        if (key.empty()) continue;

        if (key == "learning_steps") {
            ok = parseStepsLine(val, cfg.learning_steps);
        }
        else if (key == "relearning_steps") {
            ok = parseStepsLine(val, cfg.relearning_steps);
        }
        else {
            int* target = nullptr;
            if (key == "graduating_interval") target = &cfg.graduating_interval;
            else if (key == "easy_interval") target = &cfg.easy_interval;
            else if (key == "new_cards_per_day") target = &cfg.new_cards_per_day;
            if (!target) {
                spdlog::debug("LearningConfig: ignoring unknown key '{}'", key);
                continue;
            }
            try {
                *target = std::stoi(val);
            }
            catch (const std::exception&) {
                ok = false;
            }
        }

        if (!ok) spdlog::warn("LearningConfig: bad value for '{}': '{}'", key, val);
    }

    if (ok) {
        try {
            cfg.validate();
            return cfg;
        }
        catch (const InvalidConfigError& e) {
            spdlog::warn("LearningConfig rejected: {}", e.what());
        }
    }

    spdlog::warn("Falling back to default learning configuration");
    return defaults();
}

bool LearningConfig::operator==(const LearningConfig& o) const {
    return learning_steps == o.learning_steps
        && relearning_steps == o.relearning_steps
        && graduating_interval == o.graduating_interval
        && easy_interval == o.easy_interval
        && new_cards_per_day == o.new_cards_per_day;
}
