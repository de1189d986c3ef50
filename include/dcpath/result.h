#ifndef DCPATH_RESULT_H
#define DCPATH_RESULT_H

#include <dcpath/config.h>
#include <dcpath/error.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace dcpath {

/**
 * Either a value of type T or the DCError that prevented producing it.
 *
 * Reading the value of a failed Result throws DCException carrying the error,
 * so callers test is_error() first on paths where failure is expected.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(DCError error) : data_(error) {}

    bool is_success() const noexcept { return data_.index() == 0; }
    bool is_ok() const noexcept { return is_success(); }
    bool is_error() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    DCError error() const noexcept {
        return is_error() ? std::get<1>(data_) : DCError::SUCCESS;
    }

    const T& value() const & {
        check();
        return std::get<0>(data_);
    }

    T& value() & {
        check();
        return std::get<0>(data_);
    }

    T value() && {
        check();
        return std::move(std::get<0>(data_));
    }

    const T& operator*() const & { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    /**
     * Transform the value, passing an error through unchanged.
     */
    template<typename F>
    auto map(F&& func) const & -> Result<std::decay_t<decltype(func(std::declval<const T&>()))>> {
        if (is_error()) {
            return error();
        }
        return func(std::get<0>(data_));
    }

private:
    void check() const {
        if (is_error()) {
            throw DCException(std::get<1>(data_));
        }
    }

    std::variant<T, DCError> data_;
};

template<>
class Result<void> {
public:
    Result() noexcept = default;
    Result(DCError error) noexcept : error_(error) {}

    bool is_success() const noexcept { return error_ == DCError::SUCCESS; }
    bool is_ok() const noexcept { return is_success(); }
    bool is_error() const noexcept { return !is_success(); }
    explicit operator bool() const noexcept { return is_success(); }

    DCError error() const noexcept { return error_; }

private:
    DCError error_ = DCError::SUCCESS;
};

template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(DCError error) {
    return Result<T>(error);
}

#define DCPATH_RESULT_CONCAT_(a, b) a##b
#define DCPATH_RESULT_CONCAT(a, b) DCPATH_RESULT_CONCAT_(a, b)

// Return the error of expr from the enclosing function, otherwise move its
// value into lhs, which may be a declaration: DCPATH_TRY_ASSIGN(auto id, f());
#define DCPATH_TRY_ASSIGN(lhs, expr) \
    DCPATH_TRY_ASSIGN_IMPL_(DCPATH_RESULT_CONCAT(dcpath_try_result_, __LINE__), lhs, expr)

#define DCPATH_TRY_ASSIGN_IMPL_(tmp, lhs, expr) \
    auto tmp = (expr); \
    if (tmp.is_error()) { \
        return tmp.error(); \
    } \
    lhs = std::move(tmp).value()

#define DCPATH_TRY_VOID(expr) \
    do { \
        auto dcpath_try_result_ = (expr); \
        if (dcpath_try_result_.is_error()) { \
            return dcpath_try_result_.error(); \
        } \
    } while (0)

} // namespace dcpath

#endif // DCPATH_RESULT_H
