/**
 * Pokemon Battle Engine - Error Types
 *
 * Every error is request-scoped. The service layer maps each class to a
 * structured payload via error_type().
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pokebattle {

class BattleError : public std::runtime_error {
public:
    explicit BattleError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Machine-readable tag for the error payload.
     */
    virtual const char* error_type() const noexcept = 0;
};

/**
 * Unknown Pokemon or move name.
 */
class NotFoundError : public BattleError {
public:
    explicit NotFoundError(const std::string& message) : BattleError(message) {}
    const char* error_type() const noexcept override { return "not_found"; }
};

/**
 * Profile or move data is missing required stats/types or holds bad tokens.
 */
class DataIntegrityError : public BattleError {
public:
    explicit DataIntegrityError(const std::string& message) : BattleError(message) {}
    const char* error_type() const noexcept override { return "data_integrity"; }
};

/**
 * Malformed request (empty names, wrong argument types, bad config values).
 */
class InvalidArgumentError : public BattleError {
public:
    explicit InvalidArgumentError(const std::string& message) : BattleError(message) {}
    const char* error_type() const noexcept override { return "invalid_argument"; }
};

} // namespace pokebattle
