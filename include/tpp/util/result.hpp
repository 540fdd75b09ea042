#ifndef TPP_RESULT_HPP
#define TPP_RESULT_HPP

#include <concepts>
#include <optional>
#include <utility>
#include <variant>

#include "tpp/util/assert.hpp"

#include "tpp/fwd.hpp"

namespace tpp {

struct Success_Tag { };
inline constexpr Success_Tag success_tag {};

struct Error_Tag { };
inline constexpr Error_Tag error_tag {};

/// @brief Either a value of type `T` or an error of type `E`.
/// Both are implicitly convertible to a `Result` unless `T` and `E` are the same type,
/// in which case `success_tag` or `error_tag` has to be used to disambiguate.
template <typename T, typename E>
struct [[nodiscard]] Result {
    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_storage;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        requires(!std::same_as<T, E>)
        : m_storage { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        requires(!std::same_as<T, E>)
        : m_storage { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        requires(!std::same_as<T, E>)
        : m_storage { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        requires(!std::same_as<T, E>)
        : m_storage { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr Result(Success_Tag, Args&&... args)
        : m_storage { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr Result(Error_Tag, Args&&... args)
        : m_storage { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        TPP_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        TPP_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        TPP_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_storage));
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
        TPP_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TPP_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TPP_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_storage));
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
    constexpr Result(Error_Tag, Args&&... args)
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
        TPP_ASSERT(!has_value());
        return *m_error;
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TPP_ASSERT(!has_value());
        return *m_error;
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TPP_ASSERT(!has_value());
        return std::move(*m_error);
    }
};

} // namespace tpp

#endif
