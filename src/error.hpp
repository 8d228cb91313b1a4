#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace tsid {

enum class Errc {
    ok = 0,
    clock_unavailable,
    type_mismatch,
    invalid_length,
    invalid_format,
    invalid_argument
};

// Stable names: ClockUnavailable, TypeMismatch, InvalidLength, ...
const char* errc_name(Errc code);

struct Error {
    Errc code = Errc::ok;
    std::string message;
    // Actual input length for invalid_length, 0 otherwise.
    size_t length = 0;

    std::string to_string() const;
};

Error make_error(Errc code, std::string message, size_t length = 0);

// Value or Error. Library calls never throw for the Errc kinds above;
// value() on a failed result is a programming error and throws.
template <typename T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    bool ok() const { return v_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() {
        if (!ok()) throw std::logic_error("Result::value on error: " + error().to_string());
        return std::get<0>(v_);
    }
    const T& value() const {
        if (!ok()) throw std::logic_error("Result::value on error: " + error().to_string());
        return std::get<0>(v_);
    }

    const Error& error() const {
        if (ok()) throw std::logic_error("Result::error on success");
        return std::get<1>(v_);
    }

    Errc code() const { return ok() ? Errc::ok : std::get<1>(v_).code; }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(v_) : std::move(fallback);
    }

private:
    std::variant<T, Error> v_;
};

} // namespace tsid
