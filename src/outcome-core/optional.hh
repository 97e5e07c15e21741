#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/utility.hh>

#include <memory>
#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct oc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace oc
{
/// The canonical instance of nullopt_t
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace oc

/// Either a value of type T or nothing.
/// Returned by the eliminators that may or may not yield the success value (e.g. or_consume_cause).
/// Provides a smaller API than std::optional: no operator* or operator->, access goes through value().
/// Equality comparison available; other relational operators deliberately omitted.
template <class T>
struct oc::optional
{
    static_assert(!std::is_reference_v<T>, "optional of references is not supported");

    // construction
public:
    /// Default optional is empty
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        std::construct_at(&_storage.value, oc::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy when T allows it
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Leaves rhs empty
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            std::construct_at(&_storage.value, oc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            std::construct_at(&_storage.value, rhs._storage.value);
    }

    /// Leaves rhs empty
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        reset();
        if (rhs._has_value)
        {
            std::construct_at(&_storage.value, oc::move(rhs._storage.value));
            _has_value = true;
            rhs.reset();
        }
        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this == &rhs)
            return *this;

        reset();
        if (rhs._has_value)
        {
            std::construct_at(&_storage.value, rhs._storage.value);
            _has_value = true;
        }
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        OC_ASSERT(_has_value, "attempted to access value of empty optional");
        return oc::move(_storage.value);
    }

    /// Returns the held value or the given fallback
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(oc::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    // optional<int> == true would otherwise compile through the value comparison
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    // members
private:
    union storage
    {
        storage() {}
        ~storage()
            requires std::is_trivially_destructible_v<T>
        = default;
        ~storage()
            requires(!std::is_trivially_destructible_v<T>)
        {
        }

        T value;
    };

    storage _storage;

    /// True when _storage.value holds a live T object
    bool _has_value = false;
};
