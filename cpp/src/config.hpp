#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "engine.hpp"
#include "log.hpp"

struct AppConfig {
    ExperimentConfig experiment;
    LogLevel log_level = LogLevel::Warn;
    std::string tape_path = "trades.csv";
    std::string balances_path = "balances.csv";
    std::string quotes_path;
};

// Both throw ConfigError on unreadable files, malformed JSON, wrong types or failed validation.
AppConfig parse_config(const nlohmann::json& j);
AppConfig load_config(const std::string& path);
