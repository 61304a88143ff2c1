#pragma once

#include <stdexcept>
#include <string>

namespace iit {

/**
 * Base class for errors raised by phi computations.
 *
 * Argument and programming errors (size mismatches, bad configuration
 * values) use std::invalid_argument / std::logic_error instead.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// TPM entries out of range or rows not stochastic
class InvalidTPMError : public Error {
public:
    explicit InvalidTPMError(const std::string& what) : Error("invalid TPM: " + what) {}
};

// Empty or out-of-range node subset, or an unreachable state
class InvalidSubsystemError : public Error {
public:
    explicit InvalidSubsystemError(const std::string& what)
        : Error("invalid subsystem: " + what) {}
};

// Distance solver failed to converge within tolerance
class NumericalInstabilityError : public Error {
public:
    explicit NumericalInstabilityError(const std::string& what)
        : Error("numerical instability: " + what) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& what) : Error("timeout: " + what) {}
};

class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& what) : Error("cancelled: " + what) {}
};

// Cache returned a malformed entry. Callers treat it as a miss.
class CacheCorruptionError : public Error {
public:
    explicit CacheCorruptionError(const std::string& what)
        : Error("cache corruption: " + what) {}
};

}  // namespace iit
