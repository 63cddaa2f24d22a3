// src/model/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace model {

/**
 * Error taxonomy shared by the planner and the tactical controller.
 *
 *   ConfigurationError  - invalid physical/planner parameters (fatal)
 *   MissingInputError   - forecast too short, gaps, no feed-in series
 *                         (cycle fails, previous plan retained)
 *   InvariantViolation  - no feasible action from a reachable state
 *                         (bug signal, previous plan retained, degraded)
 *   SensorUnavailable   - no SoC reading and no persisted fallback
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

class MissingInputError : public std::runtime_error {
public:
    explicit MissingInputError(const std::string& what)
        : std::runtime_error(what) {}
};

class InvariantViolation : public std::runtime_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::runtime_error(what) {}
};

class SensorUnavailable : public std::runtime_error {
public:
    explicit SensorUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace model
