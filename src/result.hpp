#pragma once

#include "id_error.hpp"

#include <bkassert/assert.hpp>

#include <exception>
#include <new>
#include <type_traits>
#include <utility>

namespace kind {

template <typename T> class result;

template <typename T>
T value_or(result<T>&& r, T&& fallback);

template <typename T>
T require(result<T>&& r);

namespace detail {

template <typename T>
struct result_base {
    template <typename... Args>
    void allocate(Args&&... args)
        noexcept(std::is_nothrow_constructible<T, Args...>::value)
    {
        ::new (&data) T (std::forward<Args>(args)...);
    }

    void destroy() noexcept(std::is_nothrow_destructible<T>::value) {
        lvalue().~T();
    }

    T& lvalue() noexcept {
        return *reinterpret_cast<T*>(&data);
    }

    T const& lvalue() const noexcept {
        return *reinterpret_cast<T const*>(&data);
    }

    T&& rvalue() noexcept {
        return std::move(lvalue());
    }

    std::aligned_storage_t<sizeof(T), alignof(T)> data;
};

} // namespace detail

//! The outcome of a fallible decode: either a T, or the id_error saying why
//! there is none. Errors are values here; nothing is thrown.
template <typename T>
class result : private detail::result_base<T> {
    static_assert(!std::is_reference<T>::value, "");

    using base = detail::result_base<T>;
public:
    using value_type = T;

    result(T const& value)
        noexcept(std::is_nothrow_copy_constructible<T>::value)
    {
        base::allocate(value);
        has_value_ = true;
    }

    result(T&& value)
        noexcept(std::is_nothrow_move_constructible<T>::value)
    {
        base::allocate(std::move(value));
        has_value_ = true;
    }

    result(id_error const e) noexcept
      : error_ {e}
    {
    }

    result(result const& other)
        noexcept(std::is_nothrow_copy_constructible<T>::value)
      : error_ {other.error_}
    {
        if (other.has_value_) {
            base::allocate(other.lvalue());
            has_value_ = true;
        }
    }

    result(result&& other)
        noexcept(std::is_nothrow_move_constructible<T>::value)
      : error_ {other.error_}
    {
        if (other.has_value_) {
            base::allocate(other.rvalue());
            has_value_ = true;
        }
    }

    result& operator=(result const& other) {
        if (this != &other) {
            reset_();
            error_ = other.error_;
            if (other.has_value_) {
                base::allocate(other.lvalue());
                has_value_ = true;
            }
        }

        return *this;
    }

    result& operator=(result&& other)
        noexcept(std::is_nothrow_move_constructible<T>::value)
    {
        if (this != &other) {
            reset_();
            error_ = other.error_;
            if (other.has_value_) {
                base::allocate(other.rvalue());
                has_value_ = true;
            }
        }

        return *this;
    }

    ~result() noexcept(std::is_nothrow_destructible<T>::value) {
        reset_();
    }

    explicit operator bool() const noexcept { return has_value_; }
    bool has_value() const noexcept { return has_value_; }

    T& value() & noexcept {
        BK_ASSERT(has_value_);
        return base::lvalue();
    }

    T const& value() const& noexcept {
        BK_ASSERT(has_value_);
        return base::lvalue();
    }

    T&& value() && noexcept {
        BK_ASSERT(has_value_);
        return base::rvalue();
    }

    id_error error() const noexcept {
        BK_ASSERT(!has_value_);
        return error_;
    }
private:
    void reset_() noexcept(std::is_nothrow_destructible<T>::value) {
        if (has_value_) {
            base::destroy();
            has_value_ = false;
        }
    }

    id_error error_   {id_error::invalid_format};
    bool     has_value_ {false};
};

template <typename T>
bool operator==(result<T> const& a, result<T> const& b) {
    if (a && b) {
        return a.value() == b.value();
    }

    return !a && !b && a.error() == b.error();
}

template <typename T>
bool operator!=(result<T> const& a, result<T> const& b) {
    return !(a == b);
}

template <typename T>
bool operator==(result<T> const& r, id_error const e) noexcept {
    return !r && r.error() == e;
}

template <typename T>
bool operator!=(result<T> const& r, id_error const e) noexcept {
    return !(r == e);
}

template <typename T>
T value_or(result<T>&& r, T&& fallback) {
    if (!r) {
        return std::move(fallback);
    }

    return std::move(r).value();
}

template <typename T>
T require(result<T>&& r) {
    if (!r) {
        BK_ASSERT(false);
        std::terminate();
    }

    return std::move(r).value();
}

} // namespace kind
