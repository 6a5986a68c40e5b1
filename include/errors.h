#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace interview_coach {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    IOError,
    NetworkError,
    ParseError,
    SchemaViolation,   // provider answered, but not in the requested shape
    InvalidState,
    Timeout,
    ProviderError,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    explicit operator bool() const { return is_error(); }
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:            return "none";
        case ErrorType::IOError:         return "io_error";
        case ErrorType::NetworkError:    return "network_error";
        case ErrorType::ParseError:      return "parse_error";
        case ErrorType::SchemaViolation: return "schema_violation";
        case ErrorType::InvalidState:    return "invalid_state";
        case ErrorType::Timeout:         return "timeout";
        case ErrorType::ProviderError:   return "provider_error";
        case ErrorType::Unknown:         return "unknown";
    }
    return "unknown";
}

inline std::string describe(const Error& error) {
    return std::string(error_type_name(error.type)) + ": " + error.message;
}

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(std::in_place_index<1>, error) {}
    Result(Error&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool is_ok() const {
        return data_.index() == 0;
    }

    bool is_error() const {
        return data_.index() == 1;
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<0>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<0>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<1>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<0>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_schema_error(const std::string& message) {
    return Error(ErrorType::SchemaViolation, message);
}

inline Error make_provider_error(const std::string& message) {
    return Error(ErrorType::ProviderError, message);
}

inline Error make_invalid_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace interview_coach
