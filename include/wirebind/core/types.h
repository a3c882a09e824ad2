#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wirebind {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidState,
    EncodeError,
    DecodeError,
    MarshallError,
    ParseError,
    NotFound,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::EncodeError: return "Encode error";
        case ErrorCode::DecodeError: return "Decode error";
        case ErrorCode::MarshallError: return "Marshall error";
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

// Error struct for detailed error information. Field-level failures name the
// offending wire field and keep the error they wrap in `cause`.
struct Error {
    ErrorCode code;
    std::string message;
    std::string field;
    std::shared_ptr<const Error> cause;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    /**
     * @brief Wrap an underlying error as a field-level failure
     *
     * The resulting message is "<what> '<field>': <cause message>" so the whole
     * chain is visible without walking `cause`.
     */
    static Error wrap(ErrorCode c, std::string fieldName, Error underlying, std::string_view what) {
        Error e;
        e.code = c;
        e.message = std::string(what) + " '" + fieldName + "': " + underlying.message;
        e.field = std::move(fieldName);
        e.cause = std::make_shared<const Error>(std::move(underlying));
        return e;
    }

    // Innermost error of the cause chain
    const Error& root() const {
        const Error* e = this;
        while (e->cause) {
            e = e->cause.get();
        }
        return *e;
    }

    // Comparison operators for ErrorCode
    bool operator==(ErrorCode c) const {
        return code == c;
    }

    bool operator!=(ErrorCode c) const {
        return code != c;
    }

    // Friend operators for ErrorCode on the left side
    friend bool operator==(ErrorCode c, const Error& error) {
        return error.code == c;
    }

    friend bool operator!=(ErrorCode c, const Error& error) {
        return error.code != c;
    }
};

// Simple Result type for operations that can fail (compatible with pre-C++23)
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    explicit operator bool() const noexcept {
        return has_value();
    }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept {
        return error_.code == ErrorCode::Success;
    }

    explicit operator bool() const noexcept {
        return has_value();
    }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace wirebind

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template<>
struct fmt::formatter<wirebind::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(wirebind::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", wirebind::errorToString(error));
    }
};
