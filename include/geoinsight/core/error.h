#ifndef GEOINSIGHT_CORE_ERROR_H_
#define GEOINSIGHT_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace geoinsight {
namespace core {

/**
 * @brief Base class for all geoinsight errors
 *
 * Data-quality gaps (unresolvable spatial keys, too few observations) are
 * never errors; they show up as absent fields in results.
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        CANCELLED = 5,
        UPSTREAM_UNAVAILABLE = 6,
        INTERNAL = 7
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

    /**
     * @brief Whether the caller may retry the same operation unchanged
     */
    bool retryable() const {
        return code_ == Code::TIMEOUT || code_ == Code::CANCELLED ||
               code_ == Code::UPSTREAM_UNAVAILABLE;
    }

private:
    Code code_;
};

/**
 * @brief Stable, upper-case name of an error code ("INVALID_ARGUMENT", ...)
 */
const char* CodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating the caller's deadline passed
 */
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
    explicit TimeoutError(const char* message)
        : Error(message, Code::TIMEOUT) {}
};

/**
 * @brief Error indicating the caller cancelled the operation
 */
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& message)
        : Error(message, Code::CANCELLED) {}
    explicit CancelledError(const char* message)
        : Error(message, Code::CANCELLED) {}
};

/**
 * @brief Error indicating an external collaborator (translator, embedder,
 * fact source) could not serve the request
 */
class UpstreamUnavailableError : public Error {
public:
    explicit UpstreamUnavailableError(const std::string& message)
        : Error(message, Code::UPSTREAM_UNAVAILABLE) {}
    explicit UpstreamUnavailableError(const char* message)
        : Error(message, Code::UPSTREAM_UNAVAILABLE) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace geoinsight

#endif // GEOINSIGHT_CORE_ERROR_H_
