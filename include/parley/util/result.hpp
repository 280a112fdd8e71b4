#ifndef PARLEY_RESULT_HPP
#define PARLEY_RESULT_HPP

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "parley/util/assert.hpp"

#include "parley/fwd.hpp"

namespace parley {

struct Success_Tag {
    explicit Success_Tag() = default;
};
inline constexpr Success_Tag success_tag {};

struct Error_Tag {
    explicit Error_Tag() = default;
};
inline constexpr Error_Tag error_tag {};

/// @brief Holds either a value of type `T` or an error of type `E`.
/// Both are implicitly convertible to the result,
/// so functions can simply `return value;` or `return error;`.
/// `T` and `E` shall be different types.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>);
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>);

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
        : m_data { std::in_place_index<0> }
    {
    }

    [[nodiscard]]
    constexpr Result(const T& value)
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_data { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_data { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        PARLEY_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        PARLEY_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        PARLEY_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        PARLEY_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        PARLEY_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        PARLEY_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_data));
    }

    template <std::convertible_to<T> U>
    [[nodiscard]]
    constexpr T value_or(U&& fallback) const&
    {
        return has_value() ? value() : T(std::forward<U>(fallback));
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_error { std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_error { std::in_place, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        PARLEY_ASSERT(m_error);
        return *m_error;
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        PARLEY_ASSERT(m_error);
        return *m_error;
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        PARLEY_ASSERT(m_error);
        return std::move(*m_error);
    }
};

} // namespace parley

#endif
