#pragma once

// Result type for calls that either produce a value or report why they could
// not. Stored as a variant, so copies and moves follow the payload types.
// Reading value() of a failed result throws std::bad_variant_access.

#include <utility>
#include <variant>

namespace elz {

// Tags an error value so it converts into the failing state of an expected.
template <class E>
class unexpected {
public:
    explicit unexpected(E e) : error_(std::move(e)) {}
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

private:
    E error_;
};

template <class E>
unexpected<E> make_unexpected(E e) { return unexpected<E>(std::move(e)); }

template <class T, class E>
class expected {
public:
    expected(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    expected(unexpected<E> failure) : state_(std::in_place_index<1>, std::move(failure).error()) {}

    explicit operator bool() const noexcept { return state_.index() == 0; }

    const T& value() const & { return std::get<0>(state_); }
    T& value() & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }
    const E& error() const & { return std::get<1>(state_); }

    const T& operator*() const & { return std::get<0>(state_); }
    T& operator*() & { return std::get<0>(state_); }
    const T* operator->() const { return &std::get<0>(state_); }
    T* operator->() { return &std::get<0>(state_); }

private:
    std::variant<T, E> state_;
};

} // namespace elz
