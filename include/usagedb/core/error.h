#ifndef USAGEDB_CORE_ERROR_H_
#define USAGEDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace usagedb {
namespace core {

/**
 * @brief Base class for all usagedb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        INTERNAL = 3,
        IO = 4,
        DATA_CORRUPTION = 5
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

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
 * @brief Error indicating a failed filesystem operation
 */
class IOError : public Error {
public:
    explicit IOError(const std::string& message)
        : Error(message, Code::IO) {}
    explicit IOError(const char* message)
        : Error(message, Code::IO) {}
};

/**
 * @brief Error indicating that persisted data could not be decoded
 *
 * Raised for malformed JSON in bucket, index or catalog files and for
 * truncated or invalid gzip streams.
 */
class CorruptionError : public Error {
public:
    explicit CorruptionError(const std::string& message)
        : Error(message, Code::DATA_CORRUPTION) {}
    explicit CorruptionError(const char* message)
        : Error(message, Code::DATA_CORRUPTION) {}
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

const char* ErrorCodeName(Error::Code code);

} // namespace core
} // namespace usagedb

#endif // USAGEDB_CORE_ERROR_H_
