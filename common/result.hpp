#ifndef POLYCURVE_COMMON_RESULT_HPP
#define POLYCURVE_COMMON_RESULT_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace polycurve {

enum class ErrorKind {
    InvalidSegmentCount,  // segments(n) with n <= 0
    InvalidTolerance      // non-positive or non-finite max_error
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSegmentCount: return "invalid_segment_count";
        case ErrorKind::InvalidTolerance: return "invalid_tolerance";
    }
    return "unknown";
}

struct CurveError {
    ErrorKind kind;
    std::string message;
};

// Either a value or a CurveError. Callers check ok() before reading value();
// reading the wrong alternative throws std::runtime_error.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(CurveError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error(std::get<CurveError>(data_).message);
        }
        return std::get<T>(data_);
    }

    const CurveError& error() const {
        if (ok()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<CurveError>(data_);
    }

    // Transform the value, passing an error through untouched
    template <typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        if (!ok()) {
            return std::get<CurveError>(data_);
        }
        return f(std::get<T>(data_));
    }

    // Chain an operation that itself returns a Result
    template <typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (!ok()) {
            return std::get<CurveError>(data_);
        }
        return f(std::get<T>(data_));
    }

private:
    std::variant<T, CurveError> data_;
};

}  // namespace polycurve

#endif // POLYCURVE_COMMON_RESULT_HPP
