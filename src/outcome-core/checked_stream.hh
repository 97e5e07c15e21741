#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/optional.hh>
#include <outcome-core/throwing.hh>
#include <outcome-core/utility.hh>

#include <cstddef>
#include <type_traits>
#include <vector>

// =========================================================================================================
// checked_stream<T, X> - lazy, single-pass sequence whose callbacks may throw failures of type X
// =========================================================================================================
//
// Elements are pulled one at a time from the source: nothing is evaluated before a terminal operation runs,
// and short-circuiting operations (limit, any_match, all_match, find_first) stop pulling early.
// A failure thrown by a callback propagates unchanged out of the terminal operation, with its dynamic type.
// Callbacks that declare a failure type (oc::throwing) must declare one covered by X.
//
// Every operation consumes the stream (&&-qualified), a consumed stream must not be used again.
//
// Intermediate:  distinct, drop_while, filter, flat_map, limit, map
// Terminal:      collect, to_vector, all_match, any_match, count, find_first, for_each, max, min
//
// Usage:
//   auto sizes = oc::checked_stream<std::string, io_failure>::wrapping(paths)
//                    .map([](std::string const& p) { return file_size(p); }) // may throw io_failure
//                    .filter([](isize s) { return s > 0; })
//                    .to_vector();
//

template <class T, class X>
struct oc::checked_stream
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "T must be a non-const object type");

    using value_type = T;
    using failure_type = X;

private:
    using source_t = throwing<oc::optional<T>(), X>;

    // factories
public:
    /// Stream over the elements of range
    /// The elements are copied into the stream, an rvalue std::vector<T> is moved
    template <class Range>
    [[nodiscard]] static checked_stream wrapping(Range&& range)
    {
        std::vector<T> items;
        if constexpr (std::is_same_v<std::remove_cvref_t<Range>, std::vector<T>> && !std::is_lvalue_reference_v<Range>)
            items = oc::move(range);
        else
            for (auto const& v : range)
                items.push_back(T(v));

        return from_source(
            [items = oc::move(items), next = std::size_t(0)]() mutable -> oc::optional<T>
            {
                if (next == items.size())
                    return oc::nullopt;
                return oc::optional<T>(oc::move(items[next++]));
            });
    }

    // intermediate operations
public:
    /// Keeps the first occurrence of each element, compared with ==
    [[nodiscard]] checked_stream distinct() &&
    {
        static_assert(requires(T const& v) { bool(v == v); }, "distinct requires equality comparable elements");

        return from_source(
            [source = take_source(), seen = std::vector<T>()]() mutable -> oc::optional<T>
            {
                while (true)
                {
                    auto next = source();
                    if (!next.has_value())
                        return next;

                    auto is_new = true;
                    for (auto const& s : seen)
                        if (bool(s == next.value()))
                        {
                            is_new = false;
                            break;
                        }

                    if (is_new)
                    {
                        seen.push_back(next.value());
                        return next;
                    }
                }
            });
    }

    /// Skips elements while predicate holds, then passes everything through
    template <class P>
    [[nodiscard]] checked_stream drop_while(P predicate) &&
    {
        check_callback<P>();
        return from_source(
            [source = take_source(), predicate = oc::move(predicate), dropping = true]() mutable -> oc::optional<T>
            {
                while (true)
                {
                    auto next = source();
                    if (!next.has_value() || !dropping)
                        return next;
                    if (!bool(oc::invoke(predicate, next.value())))
                    {
                        dropping = false;
                        return next;
                    }
                }
            });
    }

    template <class P>
    [[nodiscard]] checked_stream filter(P predicate) &&
    {
        check_callback<P>();
        return from_source(
            [source = take_source(), predicate = oc::move(predicate)]() mutable -> oc::optional<T>
            {
                while (true)
                {
                    auto next = source();
                    if (!next.has_value() || bool(oc::invoke(predicate, next.value())))
                        return next;
                }
            });
    }

    /// mapper returns an iterable range per element, its elements replace the element
    template <class F>
    [[nodiscard]] auto flat_map(F mapper) &&
    {
        check_callback<F>();

        using range_t = std::decay_t<oc::invoke_result<F&, T const&>>;
        using R = std::decay_t<decltype(*std::declval<range_t&>().begin())>;

        return checked_stream<R, X>::from_source(
            [source = take_source(), mapper = oc::move(mapper), buffer = std::vector<R>(),
             next = std::size_t(0)]() mutable -> oc::optional<R>
            {
                while (next == buffer.size())
                {
                    auto element = source();
                    if (!element.has_value())
                        return oc::nullopt;

                    buffer.clear();
                    next = 0;
                    for (auto&& r : oc::invoke(mapper, element.value()))
                        buffer.push_back(R(oc::forward<decltype(r)>(r)));
                }
                return oc::optional<R>(oc::move(buffer[next++]));
            });
    }

    /// At most max_size elements, the source is not pulled beyond them
    [[nodiscard]] checked_stream limit(isize max_size) &&
    {
        OC_ASSERT(max_size >= 0, "limit requires a non-negative size");
        return from_source(
            [source = take_source(), remaining = max_size]() mutable -> oc::optional<T>
            {
                if (remaining == 0)
                    return oc::nullopt;
                --remaining;
                return source();
            });
    }

    template <class F>
    [[nodiscard]] auto map(F mapper) &&
    {
        check_callback<F>();

        using R = std::decay_t<oc::invoke_result<F&, T const&>>;
        return checked_stream<R, X>::from_source(
            [source = take_source(), mapper = oc::move(mapper)]() mutable -> oc::optional<R>
            {
                auto next = source();
                if (!next.has_value())
                    return oc::nullopt;
                return oc::optional<R>(oc::invoke(mapper, next.value()));
            });
    }

    // terminal operations
public:
    /// accumulator(container, element) for each element, container = supplier()
    template <class S, class A>
    [[nodiscard]] auto collect(S supplier, A accumulator) &&
    {
        check_callback<S>();
        check_callback<A>();

        auto container = oc::invoke(supplier);
        drain(
            [&](T& v)
            {
                oc::invoke(accumulator, container, v);
                return true;
            });
        return container;
    }

    [[nodiscard]] std::vector<T> to_vector() &&
    {
        std::vector<T> result;
        drain(
            [&](T& v)
            {
                result.push_back(oc::move(v));
                return true;
            });
        return result;
    }

    /// True for an empty stream, stops at the first element not matching
    template <class P>
    [[nodiscard]] bool all_match(P predicate) &&
    {
        check_callback<P>();
        auto result = true;
        drain([&](T& v) { return result = bool(oc::invoke(predicate, v)); });
        return result;
    }

    /// False for an empty stream, stops at the first matching element
    template <class P>
    [[nodiscard]] bool any_match(P predicate) &&
    {
        check_callback<P>();
        auto result = false;
        drain(
            [&](T& v)
            {
                result = bool(oc::invoke(predicate, v));
                return !result;
            });
        return result;
    }

    [[nodiscard]] isize count() &&
    {
        isize n = 0;
        drain(
            [&](T&)
            {
                ++n;
                return true;
            });
        return n;
    }

    [[nodiscard]] oc::optional<T> find_first() &&
    {
        auto const source = take_source();
        return source();
    }

    template <class C>
    void for_each(C action) &&
    {
        check_callback<C>();
        drain(
            [&](T& v)
            {
                oc::invoke(action, v);
                return true;
            });
    }

    /// Greatest element according to comparator (negative/zero/positive), the first one on ties
    template <class C>
    [[nodiscard]] oc::optional<T> max(C comparator) &&
    {
        check_callback<C>();
        return oc::move(*this).select([&](T const& best, T const& v) { return int(oc::invoke(comparator, v, best)) > 0; });
    }

    /// Least element according to comparator (negative/zero/positive), the first one on ties
    template <class C>
    [[nodiscard]] oc::optional<T> min(C comparator) &&
    {
        check_callback<C>();
        return oc::move(*this).select([&](T const& best, T const& v) { return int(oc::invoke(comparator, v, best)) < 0; });
    }

    // construction
public:
    checked_stream(checked_stream&&) = default;
    checked_stream& operator=(checked_stream&&) = default;
    checked_stream(checked_stream const&) = delete;
    checked_stream& operator=(checked_stream const&) = delete;

private:
    explicit checked_stream(source_t source) : _source(oc::move(source)) {}

    template <class F>
    [[nodiscard]] static checked_stream from_source(F&& pull)
    {
        return checked_stream(source_t(oc::forward<F>(pull)));
    }

    template <class F>
    static void check_callback()
    {
        static_assert(failure_covers<X, declared_failure_or<F, X>>,
                      "the callback declares a failure type that is not covered by the failure type of this stream");
    }

    [[nodiscard]] source_t take_source()
    {
        OC_ASSERT(_source.is_valid(), "the stream has already been consumed");
        return oc::move(_source);
    }

    /// Pulls elements until the stream ends or f returns false
    template <class F>
    void drain(F&& f)
    {
        auto const source = take_source();
        while (true)
        {
            auto next = source();
            if (!next.has_value() || !f(next.value()))
                return;
        }
    }

    /// Keeps the first element and replaces it by every later element v with replaces(best, v)
    template <class F>
    [[nodiscard]] oc::optional<T> select(F&& replaces) &&
    {
        oc::optional<T> best;
        drain(
            [&](T& v)
            {
                if (!best.has_value() || replaces(best.value(), v))
                    best = oc::optional<T>(oc::move(v));
                return true;
            });
        return best;
    }

    template <class, class>
    friend struct oc::checked_stream;

    // members
private:
    source_t _source;
};
