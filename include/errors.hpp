#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace receipt_assistant {

enum class ErrorCode {
    None,
    DuplicateReceipt,
    InvalidRange,
    InvalidArgument,
    NotFound,
    EmbeddingUnavailable,
    GatewayTimeout,
    ImageUnavailable,
    StorageFailure
};

// Stable wire names, used in tool envelopes and HTTP responses.
inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::DuplicateReceipt: return "DuplicateReceipt";
        case ErrorCode::InvalidRange: return "InvalidRange";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::EmbeddingUnavailable: return "EmbeddingUnavailable";
        case ErrorCode::GatewayTimeout: return "GatewayTimeout";
        case ErrorCode::ImageUnavailable: return "ImageUnavailable";
        case ErrorCode::StorageFailure: return "StorageFailure";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

// Either a value or a typed Error. Domain outcomes (duplicates, absence,
// bad input, gateway failures) travel through this, never through exceptions.
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(ErrorCode code, std::string message) {
        Result r;
        r.error_ = Error{code, std::move(message)};
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) throw std::logic_error("Result::value() on failure: " + error_.message);
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("Result::value() on failure: " + error_.message);
        return *value_;
    }

    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Result() = default;
    std::optional<T> value_;
    Error error_;
};

// Thrown by gateway adapters (HTTP, filesystem). Callers at the store and
// compactor boundary convert it into a Result.
class GatewayError : public std::runtime_error {
public:
    enum class Kind { Timeout, Unavailable };

    GatewayError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

    ErrorCode as_embedding_error() const {
        return kind_ == Kind::Timeout ? ErrorCode::GatewayTimeout : ErrorCode::EmbeddingUnavailable;
    }

private:
    Kind kind_;
};

} // namespace receipt_assistant
