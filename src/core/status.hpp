#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace matchcore {

/// Failure categories reported by the core and its collaborators
enum class ErrorKind {
    OrderNotFound,     // cancellation target absent
    StaleTradeIntent,  // intent references an order removed mid-pass
    NoMarketData,      // both sides empty when estimating
    Encoding,          // codec could not encode a value
    Decoding           // codec could not decode bytes
};

[[nodiscard]] inline std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::OrderNotFound: return "OrderNotFound";
        case ErrorKind::StaleTradeIntent: return "StaleTradeIntent";
        case ErrorKind::NoMarketData: return "NoMarketData";
        case ErrorKind::Encoding: return "EncodingError";
        case ErrorKind::Decoding: return "DecodingError";
    }
    return "Unknown";
}

/// Error value carried by Result
struct Error {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

/// Result monad for fallible operations that should not throw
/// Holds either a value (index 0) or an error (index 1)
template <typename T, typename E = Error>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so that T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace matchcore
