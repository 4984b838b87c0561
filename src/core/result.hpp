#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace qrlink {

/**
 * ErrorCode - Failure categories surfaced by the negotiation layer.
 *
 * Validation failures are returned synchronously from the call that
 * detected them. PathFailed and EngineError arrive asynchronously through
 * the controller's error signal.
 */
enum class ErrorCode : int {
    None = 0,
    MalformedNegotiationData,  // Required SDP field missing before compression
    InvalidToken,              // Token failed to decode (bad scan, protocol mismatch)
    EngineInitError,           // Negotiation engine could not be created
    NoActiveOffer,             // acceptAnswer() without a prior createOffer()
    ChannelNotOpen,            // send() before the data channel opened
    PathFailed,                // Engine reported the path permanently unusable
    SessionInProgress,         // New lifecycle requested without close()
    EngineError                // Engine rejected a description
};

[[nodiscard]] inline const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::MalformedNegotiationData: return "MalformedNegotiationData";
        case ErrorCode::InvalidToken: return "InvalidToken";
        case ErrorCode::EngineInitError: return "EngineInitError";
        case ErrorCode::NoActiveOffer: return "NoActiveOffer";
        case ErrorCode::ChannelNotOpen: return "ChannelNotOpen";
        case ErrorCode::PathFailed: return "PathFailed";
        case ErrorCode::SessionInProgress: return "SessionInProgress";
        case ErrorCode::EngineError: return "EngineError";
    }
    return "Unknown";
}

/**
 * Error type for Result - represents a failure with a message and a code.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::None};
    
    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::None)
        : message(std::move(msg)), code(c) {}
    
    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<QString> token = compress(description, candidates);
 *   if (token.is_err()) {
 *       return Result<void>::err(token.unwrap_err());
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;
    
    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    
    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }
    
    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }
    
    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }
    
    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }
    
    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }
    
    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }
    
    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }
    
    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }
    
    /**
     * Transform the success value; errors propagate unchanged.
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }
    
    /**
     * Chain an operation that itself returns a Result.
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}
    
    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }
    
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;
    
    [[nodiscard]] static Result ok() {
        return Result(true);
    }
    
    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }
    
    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }
    
    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }
    
    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }
    
    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}
    
    bool is_ok_;
    E error_{};
};

/**
 * Shorthand for building an Error result with a code.
 */
template<typename T>
[[nodiscard]] Result<T, Error> fail(ErrorCode code, std::string message) {
    return Result<T, Error>::err(Error{std::move(message), code});
}

} // namespace qrlink
