#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kvconn {

/**
 * @brief Error categories for the connection layer
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    INVALID_INITIALIZER,
    UNKNOWN_SCHEME,
    CONTRACT_VIOLATION,
    INVALID_ARGUMENT,
    CONNECTION_ERROR,
    PROTOCOL_ERROR,
    NOT_SUPPORTED
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::PARSE_ERROR: return "parse_error";
        case ErrorCategory::INVALID_INITIALIZER: return "invalid_initializer";
        case ErrorCategory::UNKNOWN_SCHEME: return "unknown_scheme";
        case ErrorCategory::CONTRACT_VIOLATION: return "contract_violation";
        case ErrorCategory::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCategory::CONNECTION_ERROR: return "connection_error";
        case ErrorCategory::PROTOCOL_ERROR: return "protocol_error";
        case ErrorCategory::NOT_SUPPORTED: return "not_supported";
        default: return "unknown";
    }
}

/**
 * @brief Base exception for everything thrown by kvconn
 */
class KvError : public std::runtime_error {
public:
    KvError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Raised by define() when an initializer cannot build connections
 */
class InvalidInitializer : public KvError {
public:
    explicit InvalidInitializer(const std::string& message)
        : KvError(ErrorCategory::INVALID_INITIALIZER, message) {}
};

/**
 * @brief Raised by create()/aggregate() for a scheme with no initializer
 */
class UnknownScheme : public KvError {
public:
    explicit UnknownScheme(std::string scheme)
        : KvError(ErrorCategory::UNKNOWN_SCHEME, "Unknown connection scheme: " + scheme),
          scheme_(std::move(scheme)) {}

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }

private:
    std::string scheme_;
};

/**
 * @brief Raised when an initializer produced something that is not a connection
 */
class ContractViolation : public KvError {
public:
    explicit ContractViolation(const std::string& message)
        : KvError(ErrorCategory::CONTRACT_VIOLATION, message) {}
};

/**
 * @brief Raised when connection parameters cannot be normalized
 */
class ParameterError : public KvError {
public:
    explicit ParameterError(const std::string& message)
        : KvError(ErrorCategory::PARSE_ERROR, message) {}
};

/**
 * @brief Transport and protocol failures raised by connection implementations
 */
class ConnectionError : public KvError {
public:
    explicit ConnectionError(const std::string& message,
                             ErrorCategory category = ErrorCategory::CONNECTION_ERROR)
        : KvError(category, message) {}
};

/**
 * @brief Result type for operations that can fail without throwing
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace kvconn
