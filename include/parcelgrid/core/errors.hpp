#pragma once

#include <stdexcept>
#include <string>

namespace parcelgrid::core {

// Malformed map, bad placement or a scenario that cannot be generated.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The caller broke the step contract. No state was mutated.
class InvocationError : public std::invalid_argument {
public:
    explicit InvocationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace parcelgrid::core
