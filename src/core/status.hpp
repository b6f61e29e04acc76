#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tether {

/// Value-or-error return type for fallible parsing and loading
/// Index 0 holds the value, index 1 the error, so T == E is allowed
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    explicit operator bool() const noexcept {
        return is_ok();
    }

    /// Get the value (throws std::logic_error if this holds an error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on an error");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::logic_error("Result::value() called on an error");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws std::logic_error if this holds a value)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("Result::error() called on a value");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return fallback;
    }

    /// Transform the value, carrying an error through untouched
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace tether
