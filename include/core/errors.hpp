/**
 * @file errors.hpp
 * @brief Classified engine errors
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Databrain {

enum class ErrorKind {
    Validation,
    Conflict,
    NotFound,
    StoreUnavailable
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base class for every error the engine reports to callers.
 */
class BrainError : public std::runtime_error {
public:
    BrainError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * @brief True if the caller may retry the same request unchanged.
     */
    bool retryable() const {
        return kind_ == ErrorKind::Conflict || kind_ == ErrorKind::StoreUnavailable;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Malformed parameters, self-loops, unknown or merged-away targets.
 * Raised before any state change.
 */
class ValidationError : public BrainError {
public:
    explicit ValidationError(const std::string& message)
        : BrainError(ErrorKind::Validation, message) {}
};

/**
 * @brief Optimistic-concurrency retries exhausted on a contended node.
 */
class ConflictError : public BrainError {
public:
    explicit ConflictError(const std::string& message)
        : BrainError(ErrorKind::Conflict, message) {}
};

class NotFoundError : public BrainError {
public:
    explicit NotFoundError(const std::string& message)
        : BrainError(ErrorKind::NotFound, message) {}
};

/**
 * @brief Backing store unreachable or timed out. The transaction was rolled back.
 */
class StoreUnavailableError : public BrainError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : BrainError(ErrorKind::StoreUnavailable, message) {}
};

} // namespace Databrain
