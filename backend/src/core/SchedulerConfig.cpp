#include "SchedulerConfig.hpp"
#include "Errors.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

double parseDouble(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        double d = std::stod(val, &used);
        if (used != val.size() || !std::isfinite(d))
            throw ConfigError("bad number for '" + key + "': " + val);
        return d;
    }
    catch (const std::logic_error&) {
        throw ConfigError("bad number for '" + key + "': " + val);
    }
}

long long parseInt(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        long long n = std::stoll(val, &used);
        if (used != val.size())
            throw ConfigError("bad integer for '" + key + "': " + val);
        return n;
    }
    catch (const std::logic_error&) {
        throw ConfigError("bad integer for '" + key + "': " + val);
    }
}

int parseIntField(const std::string& key, const std::string& val) {
    long long n = parseInt(key, val);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
        throw ConfigError("value for '" + key + "' out of range: " + val);
    return static_cast<int>(n);
}

} // namespace

double SchedulerConfig::multiplierFor(ReviewQuality q) const {
    switch (q) {
    case ReviewQuality::AGAIN: return multiplier_again;
    case ReviewQuality::HARD: return multiplier_hard;
    case ReviewQuality::GOOD: return multiplier_good;
    case ReviewQuality::EASY: return multiplier_easy;
    }
    throw InvalidGradeError("unknown review quality");
}

void SchedulerConfig::validate() const {
    if (multiplier_again <= 0 || multiplier_hard <= 0 || multiplier_good <= 0 || multiplier_easy <= 0)
        throw ConfigError("stability multipliers must be positive");
    if (stability_floor <= 0)
        throw ConfigError("stability_floor must be positive");
    if (initial_stability < stability_floor)
        throw ConfigError("initial_stability must not be below stability_floor");
    if (max_stability < initial_stability)
        throw ConfigError("max_stability must not be below initial_stability");
    if (max_stability > STABILITY_CEILING)
        throw ConfigError("max_stability must not exceed 3650000 days");
    if (min_difficulty < 1.0 || max_difficulty > 10.0 || min_difficulty > max_difficulty)
        throw ConfigError("difficulty bounds must lie within [1, 10]");
    if (default_difficulty < min_difficulty || default_difficulty > max_difficulty)
        throw ConfigError("default_difficulty outside difficulty bounds");
    if (difficulty_penalty < 0 || difficulty_reward < 0)
        throw ConfigError("difficulty adjustments must be non-negative");
    if (mastery_threshold_days <= 0)
        throw ConfigError("mastery_threshold_days must be positive");
    if (leech_threshold < 1)
        throw ConfigError("leech_threshold must be at least 1");
    if (reviews_per_new < 1)
        throw ConfigError("reviews_per_new must be at least 1");
    if (target_retention <= 0 || target_retention >= 1)
        throw ConfigError("target_retention must lie in (0, 1)");
    if (maximum_interval_days < 1)
        throw ConfigError("maximum_interval_days must be at least 1");
    if (client_skew_tolerance_seconds < 0 || client_skew_tolerance_seconds > MAX_CLIENT_SKEW_SECONDS)
        throw ConfigError("client_skew_tolerance_seconds must lie in [0, 86400]");
}

std::string SchedulerConfig::serialize() const {
    std::ostringstream oss;
    oss.precision(17);
    oss << "multiplier_again:" << multiplier_again << "\n"
        << "multiplier_hard:" << multiplier_hard << "\n"
        << "multiplier_good:" << multiplier_good << "\n"
        << "multiplier_easy:" << multiplier_easy << "\n"
        << "stability_floor:" << stability_floor << "\n"
        << "initial_stability:" << initial_stability << "\n"
        << "max_stability:" << max_stability << "\n"
        << "default_difficulty:" << default_difficulty << "\n"
        << "min_difficulty:" << min_difficulty << "\n"
        << "max_difficulty:" << max_difficulty << "\n"
        << "difficulty_penalty:" << difficulty_penalty << "\n"
        << "difficulty_reward:" << difficulty_reward << "\n"
        << "mastery_threshold_days:" << mastery_threshold_days << "\n"
        << "leech_threshold:" << leech_threshold << "\n"
        << "reviews_per_new:" << reviews_per_new << "\n"
        << "target_retention:" << target_retention << "\n"
        << "maximum_interval_days:" << maximum_interval_days << "\n"
        << "client_skew_tolerance_seconds:" << client_skew_tolerance_seconds << "\n"
        << "idempotency_cache_size:" << idempotency_cache_size << "\n";
    return oss.str();
}

void SchedulerConfig::deserialize(const std::string& data) {
    SchedulerConfig parsed = *this;
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find(':');
        if (pos == std::string::npos)
            throw ConfigError("expected key:value, got '" + line + "'");

        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));

        if (key == "multiplier_again") parsed.multiplier_again = parseDouble(key, val);
        else if (key == "multiplier_hard") parsed.multiplier_hard = parseDouble(key, val);
        else if (key == "multiplier_good") parsed.multiplier_good = parseDouble(key, val);
        else if (key == "multiplier_easy") parsed.multiplier_easy = parseDouble(key, val);
        else if (key == "stability_floor") parsed.stability_floor = parseDouble(key, val);
        else if (key == "initial_stability") parsed.initial_stability = parseDouble(key, val);
        else if (key == "max_stability") parsed.max_stability = parseDouble(key, val);
        else if (key == "default_difficulty") parsed.default_difficulty = parseDouble(key, val);
        else if (key == "min_difficulty") parsed.min_difficulty = parseDouble(key, val);
        else if (key == "max_difficulty") parsed.max_difficulty = parseDouble(key, val);
        else if (key == "difficulty_penalty") parsed.difficulty_penalty = parseDouble(key, val);
        else if (key == "difficulty_reward") parsed.difficulty_reward = parseDouble(key, val);
        else if (key == "mastery_threshold_days") parsed.mastery_threshold_days = parseDouble(key, val);
        else if (key == "leech_threshold") parsed.leech_threshold = parseIntField(key, val);
        else if (key == "reviews_per_new") parsed.reviews_per_new = parseIntField(key, val);
        else if (key == "target_retention") parsed.target_retention = parseDouble(key, val);
        else if (key == "maximum_interval_days") parsed.maximum_interval_days = parseIntField(key, val);
        else if (key == "client_skew_tolerance_seconds")
            parsed.client_skew_tolerance_seconds = static_cast<std::time_t>(parseInt(key, val));
        else if (key == "idempotency_cache_size") {
            long long n = parseInt(key, val);
            if (n < 0) throw ConfigError("idempotency_cache_size must be non-negative");
            parsed.idempotency_cache_size = static_cast<std::size_t>(n);
        }
        else
            throw ConfigError("unknown config key '" + key + "'");
    }

    parsed.validate();
    *this = parsed;
}

SchedulerConfig SchedulerConfig::loadFromFile(const std::string& filename) {
    SchedulerConfig cfg;

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Config file '{}' not found; using defaults", filename);
        return cfg;
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    cfg.deserialize(buf.str());

    spdlog::info("Loaded scheduler config from '{}'", filename);
    return cfg;
}
