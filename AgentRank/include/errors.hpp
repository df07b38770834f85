#pragma once
#include <stdexcept>
#include <string>
#include <utility>

/*
-------------------------------------------------------------------------------
 errors.hpp — Exception types for the ranking engine
-------------------------------------------------------------------------------
  - ValidationError     : CustomerProfile outside its closed value sets.
  - ConfigurationError  : bad weight vector or normalization domain. Raised
                          when a config is built or loaded, never mid-request.
  - DataIntegrityError  : aggregated counts that break their invariants.

Records that are merely inconsistent (dangling foreign keys, duplicate
bookings) are skipped and reported, see check_integrity in helpers.hpp.
-------------------------------------------------------------------------------
*/

class AgentRankError : public std::runtime_error {
public:
    explicit AgentRankError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

class ValidationError : public AgentRankError {
public:
    explicit ValidationError(std::string msg) : AgentRankError(std::move(msg)) {}
};

class ConfigurationError : public AgentRankError {
public:
    explicit ConfigurationError(std::string msg) : AgentRankError(std::move(msg)) {}
};

class DataIntegrityError : public AgentRankError {
public:
    explicit DataIntegrityError(std::string msg) : AgentRankError(std::move(msg)) {}
};
