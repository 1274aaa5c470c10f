// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#ifndef TPSDK_ERRORS_HPP
#define TPSDK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "entity_model.hpp"

namespace tpsdk {

/**
 * @brief Invalid argument passed to a client operation
 */
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Descriptor generation or validation failed
 *
 * Carries every violation found, not only the first one.
 */
class DescriptorError : public std::runtime_error {
public:
    DescriptorError(const std::string& what, std::vector<Violation> violations)
        : std::runtime_error(what), violations_(std::move(violations)) {}

    const std::vector<Violation>& violations() const { return violations_; }

private:
    std::vector<Violation> violations_;
};

/**
 * @brief Configuration could not be loaded or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tpsdk

#endif // TPSDK_ERRORS_HPP
