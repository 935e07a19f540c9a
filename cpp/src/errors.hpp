// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

// Malformed order or query argument (non-positive price/qty/depth, duplicate id).
struct ValidationError : std::invalid_argument {
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

struct NotFoundError : std::out_of_range {
    explicit NotFoundError(const std::string& what) : std::out_of_range(what) {}
};

// Raised by a trader's decision logic; the session treats it as "no order".
struct StrategyComputationError : std::runtime_error {
    explicit StrategyComputationError(const std::string& what) : std::runtime_error(what) {}
};

// Configuration too malformed for a session to initialise.
struct ConfigError : std::invalid_argument {
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};
