#ifndef SHAREMIRROR_EXPECTED_H
#define SHAREMIRROR_EXPECTED_H 1

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include <sharemirror/types.h>

namespace sharemirror
{

template<typename T>
class Unexpected
{
    // The error value we're wrapping.
    T mValue;

public:
    Unexpected(T&& value)
      : mValue(std::move(value))
    {
    }

    Unexpected(const T& value)
      : mValue(value)
    {
    }

    T& value() &
    {
        return mValue;
    }

    T&& value() &&
    {
        return std::move(mValue);
    }

    const T& value() const&
    {
        return mValue;
    }
}; // Unexpected<T>

// For convenience.
template<typename T>
auto unexpected(T&& value)
{
    return Unexpected<std::decay_t<T>>(std::forward<T>(value));
}

template<typename E, typename T>
class Expected
{
    template<typename U>
    static constexpr auto IsCompatibleValueV =
      std::is_constructible_v<T, U>
      && !std::is_same_v<std::decay_t<U>, Expected>
      && !std::is_same_v<std::decay_t<U>, E>;

    std::variant<E, T> mValue;

public:
    Expected()
      : mValue()
    {
    }

    template<typename F>
    Expected(Unexpected<F>&& other)
      : mValue(std::in_place_type_t<E>(), std::move(other).value())
    {
    }

    template<typename F>
    Expected(const Unexpected<F>& other)
      : mValue(std::in_place_type_t<E>(), other.value())
    {
    }

    template<typename U, std::enable_if_t<IsCompatibleValueV<U>>* = nullptr>
    Expected(U&& other)
      : mValue(std::in_place_type_t<T>(), std::forward<U>(other))
    {
    }

    Expected(const Expected& other) = default;

    Expected(Expected&& other) = default;

    Expected& operator=(const Expected& rhs) = default;

    Expected& operator=(Expected&& rhs) = default;

    operator bool() const
    {
        return hasValue();
    }

    bool operator!() const
    {
        return hasError();
    }

    T* operator->()
    {
        return &value();
    }

    const T* operator->() const
    {
        return &value();
    }

    T& operator*() &
    {
        return value();
    }

    T&& operator*() &&
    {
        return std::move(*this).value();
    }

    const T& operator*() const&
    {
        return value();
    }

    bool hasError() const
    {
        return std::holds_alternative<E>(mValue);
    }

    bool hasValue() const
    {
        return std::holds_alternative<T>(mValue);
    }

    E& error() &
    {
        assert(hasError());

        return std::get<E>(mValue);
    }

    E&& error() &&
    {
        assert(hasError());

        return std::get<E>(std::move(mValue));
    }

    const E& error() const&
    {
        assert(hasError());

        return std::get<E>(mValue);
    }

    T& value() &
    {
        assert(hasValue());

        return std::get<T>(mValue);
    }

    T&& value() &&
    {
        assert(hasValue());

        return std::get<T>(std::move(mValue));
    }

    const T& value() const&
    {
        assert(hasValue());

        return std::get<T>(mValue);
    }

    T valueOr(T defaultValue) const&
    {
        if (hasValue())
            return std::get<T>(mValue);

        return defaultValue;
    }
}; // Expected<E, T>

template<typename T>
using ErrorOr = Expected<Error, T>;

} // sharemirror

#endif
