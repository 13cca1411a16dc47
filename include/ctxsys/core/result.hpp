#pragma once

#include "errors.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ctxsys::core {

// Value-or-error return type used by every fallible operation in the library
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result<T, E> ok(T value) {
        return Result<T, E>(std::move(value));
    }

    static Result<T, E> err(E error) {
        return Result<T, E>(std::move(error));
    }

    static Result<T, E> err(ErrorCode code) {
        return Result<T, E>(E{code});
    }

    static Result<T, E> err(ErrorCode code, std::string message) {
        return Result<T, E>(E{code, std::move(message)});
    }

    static Result<T, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<T, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<0>(data_);
    }

    T&& value() && {
        if (!is_ok()) {
            throw std::runtime_error("Result::value() called on error");
        }
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<1>(data_);
    }

    E&& error() && {
        if (!is_err()) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::get<1>(std::move(data_));
    }

    // nullptr when holding an error
    T* operator->() {
        return is_ok() ? &std::get<0>(data_) : nullptr;
    }

    const T* operator->() const {
        return is_ok() ? &std::get<0>(data_) : nullptr;
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(f(std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return f(std::get<0>(data_));
        }
        return ResultType::err(std::get<1>(data_));
    }

    T unwrap_or(T default_value) const {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    T unwrap() const {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error(std::get<1>(data_).full_message());
        } else {
            throw std::runtime_error("Result unwrap failed");
        }
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : has_error_(false) {}
    Result(const E& error) : error_(error), has_error_(true) {}
    Result(E&& error) : error_(std::move(error)), has_error_(true) {}

    static Result<void, E> ok() {
        return Result<void, E>();
    }

    static Result<void, E> err(E error) {
        return Result<void, E>(std::move(error));
    }

    static Result<void, E> err(ErrorCode code) {
        return Result<void, E>(E{code});
    }

    static Result<void, E> err(ErrorCode code, std::string message) {
        return Result<void, E>(E{code, std::move(message)});
    }

    static Result<void, E> err(ErrorCode code, std::string message, std::string context) {
        return Result<void, E>(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !has_error_; }
    bool is_err() const { return has_error_; }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return error_;
    }

    const E& error() const& {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return error_;
    }

    E&& error() && {
        if (!has_error_) {
            throw std::runtime_error("Result::error() called on ok");
        }
        return std::move(error_);
    }

private:
    E error_;
    bool has_error_;
};

}  // namespace ctxsys::core
