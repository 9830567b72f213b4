#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace flowguard {

/// Value-or-error return type for fallible operations
///
/// Loaders, the query builder and the detector report failure through this
/// instead of throwing. Index 0 holds the value, index 1 the error, so
/// Result<std::string, std::string> stays unambiguous.
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /// Throws std::logic_error when holding an error
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on an error");
        }
        return std::get<0>(data_);
    }

    /// Throws std::logic_error when holding a value
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("Result::error() called on a value");
        }
        return std::get<1>(data_);
    }

    /// Move the value out; reading tables and detector output are large
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::logic_error("Result::take_value() called on an error");
        }
        return std::get<0>(std::move(data_));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace flowguard
