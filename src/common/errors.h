#ifndef IDPOOL_COMMON_ERRORS_H_
#define IDPOOL_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace IdPool {

/**
 * Base class of every error raised by the allocator stack
 */
class IdPoolError : public std::runtime_error {
public:
    explicit IdPoolError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid construction parameters or configuration. Nothing is constructed.
class ConfigurationError : public IdPoolError {
public:
    explicit ConfigurationError(const std::string& what) : IdPoolError(what) {}
};

// The authoritative source could not produce the next raw value.
class SourceFetchError : public IdPoolError {
public:
    explicit SourceFetchError(const std::string& what) : IdPoolError(what) {}
};

// A partition was queried before any value was fetched for it.
class StateNotInitializedError : public IdPoolError {
public:
    explicit StateNotInitializedError(const std::string& what) : IdPoolError(what) {}
};

// Misuse of a numeric holder: uninitialized read, mixed types, overflow, bad text.
class HolderError : public IdPoolError {
public:
    explicit HolderError(const std::string& what) : IdPoolError(what) {}
};

} // namespace IdPool

#endif // IDPOOL_COMMON_ERRORS_H_
