#pragma once

#include <vkenc/error.hpp>

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace vkenc {

// Result<T> holds either a value or an Error.
// No chaining. Check ok(), then take value() or error().
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}             // NOLINT implicit
    Result(Error error) : data_(std::move(error)) {}         // NOLINT implicit

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Failed with a VkResult the caller may retry next frame.
    [[nodiscard]] bool recoverable() const {
        return !ok() && std::get<Error>(data_).recoverable();
    }

    [[nodiscard]] T& value() & {
        assert(ok() && "value() on a failed Result");
        return std::get<T>(data_);
    }

    [[nodiscard]] const T& value() const& {
        assert(ok() && "value() on a failed Result");
        return std::get<T>(data_);
    }

    [[nodiscard]] T value() && {
        assert(ok() && "value() on a failed Result");
        return std::move(std::get<T>(data_));
    }

    [[nodiscard]] Error& error() & {
        assert(!ok() && "error() on a successful Result");
        return std::get<Error>(data_);
    }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on a successful Result");
        return std::get<Error>(data_);
    }

    [[nodiscard]] Error error() && {
        assert(!ok() && "error() on a successful Result");
        return std::move(std::get<Error>(data_));
    }

    // Unwrap, or hand the error to throwError().
    [[nodiscard]] T orThrow() && {
        if (!ok()) throwError(error());
        return std::move(std::get<T>(data_));
    }

private:
    std::variant<T, Error> data_;
};

// Success carries no value.
template <>
class Result<void> {
public:
    Result() : error_{} {}                                      // success
    Result(Error error) : error_(std::move(error)) {}           // NOLINT implicit

    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] bool recoverable() const {
        return error_.has_value() && error_->recoverable();
    }

    [[nodiscard]] Error& error() & {
        assert(!ok() && "error() on a successful Result<void>");
        return *error_;
    }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on a successful Result<void>");
        return *error_;
    }

    void orThrow() && {
        if (!ok()) throwError(error());
    }

private:
    std::optional<Error> error_;
};

} // namespace vkenc
