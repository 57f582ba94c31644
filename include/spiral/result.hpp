#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace spiral {

// Failure kinds for loading data files and splitting identifiers
enum class ErrorCode {
    OK = 0,
    IO_ERROR,           // Data file missing or unreadable
    CORRUPTION,         // Malformed frequency data
    INPUT_TOO_LARGE     // Identifier exceeds SplitterConfig::max_identifier_length
};

class Error {
public:
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // "CODE: message", or just "CODE" without a message
    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INPUT_TOO_LARGE: return "INPUT_TOO_LARGE";
        }
        return "UNKNOWN";
    }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * Value or Error returned by loaders and SamuraiSplitter::split.
 * value() throws std::runtime_error when called on an error.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }

    T& value() & {
        check();
        return std::get<T>(data_);
    }

    const T& value() const& {
        check();
        return std::get<T>(data_);
    }

    // Throws std::logic_error when called on a value
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        return ok() ? ErrorCode::OK : error().code();
    }

private:
    void check() const {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
    }

    std::variant<T, Error> data_;
};

}  // namespace spiral
