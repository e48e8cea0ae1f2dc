#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace viva {

enum class ErrorType {
    None,
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    ResourceError,
    Timeout,
    NotFound,
    ValidationError,
    AlreadyRecording,
    NoActiveRecording,
    Unknown
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::IOError: return "IOError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::ResourceError: return "ResourceError";
        case ErrorType::Timeout: return "Timeout";
        case ErrorType::NotFound: return "NotFound";
        case ErrorType::ValidationError: return "ValidationError";
        case ErrorType::AlreadyRecording: return "AlreadyRecording";
        case ErrorType::NoActiveRecording: return "NoActiveRecording";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief A failure kind plus a human-readable message
 *
 * The message is what reaches clients in error records, so it names the
 * offending session, question id or field rather than internal detail.
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, std::string msg) : type(t), message(std::move(msg)) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// "Type: message", for log lines
    std::string describe() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Either a value of type T or an Error
 *
 * Returned from every boundary that can fail (reasoning, transcription,
 * synthesis, file and socket I/O). Accessing the wrong alternative throws
 * std::logic_error; callers test with is_ok() or operator bool first.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        if (const T* v = std::get_if<T>(&data_)) return *v;
        throw std::logic_error("Result holds an error: " + std::get<Error>(data_).message);
    }

    T& value() {
        if (T* v = std::get_if<T>(&data_)) return *v;
        throw std::logic_error("Result holds an error: " + std::get<Error>(data_).message);
    }

    /// Move the value out; the Result is left holding a moved-from T
    T take() { return std::move(value()); }

    const Error& error() const {
        if (const Error* e = std::get_if<Error>(&data_)) return *e;
        throw std::logic_error("Result holds a value, not an error");
    }

    T value_or(T fallback) const {
        const T* v = std::get_if<T>(&data_);
        return v ? *v : std::move(fallback);
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const Error& error() const {
        if (!error_) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

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

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_not_found_error(const std::string& message) {
    return Error(ErrorType::NotFound, message);
}

inline Error make_validation_error(const std::string& message) {
    return Error(ErrorType::ValidationError, message);
}

inline Error make_invalid_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_resource_error(const std::string& message) {
    return Error(ErrorType::ResourceError, message);
}

} // namespace viva
