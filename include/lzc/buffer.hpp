// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_BUFFER_HPP
#define LZC_BUFFER_HPP

// Root buffer adapter for lzc.
//
// A lazy_concat materialises into a caller-chosen contiguous container (the
// "root").  This header names what the container must provide, picks the
// read-only view type handed back to callers, and funnels every append and
// slice through buffer_traits so string-like and vector-like roots share one
// code path.

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>

namespace lzc {

template <typename T>
class basic_fragment;

// True for the character types that get std::basic_string_view slices.
template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<std::remove_cv_t<T>, char> ||
    std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
    std::is_same_v<std::remove_cv_t<T>, char8_t> ||
    std::is_same_v<std::remove_cv_t<T>, char16_t> ||
    std::is_same_v<std::remove_cv_t<T>, char32_t>;

// Read-only contiguous view over elements of T.  Text gets a string_view so
// slices compare against literals and stream naturally; everything else gets
// a span.
template <typename T>
using view_t = std::conditional_t<is_character_v<T>,
                                  std::basic_string_view<std::remove_cv_t<T>>,
                                  std::span<const T>>;

// Requirements on a root buffer: empty construction, size and contiguous
// data, and appending a [first, last) pointer range at the end.
template <typename B>
concept root_buffer =
    std::default_initializable<B> && std::movable<B> &&
    requires(B& b, const B& cb, const typename B::value_type* p) {
        typename B::value_type;
        { cb.size() } -> std::convertible_to<std::size_t>;
        { cb.data() } -> std::convertible_to<const typename B::value_type*>;
        b.insert(b.end(), p, p);
    };

// A contiguous, sized range of T that a fragment can take ownership of by
// move.  Views (borrowed ranges) are excluded: they never own their data.
// So are fragments, which are enqueued as they are.
template <typename C, typename T>
concept owning_source_of =
    std::ranges::contiguous_range<C> && std::ranges::sized_range<C> &&
    !std::ranges::borrowed_range<C> &&
    !std::same_as<std::remove_cvref_t<C>, basic_fragment<T>> &&
    std::same_as<std::remove_cv_t<std::ranges::range_value_t<C>>, T>;

// Append/slice adapter for root buffers.  The primary template covers every
// type satisfying root_buffer; specialise it for containers that need a
// cheaper append path than insert-at-end.
template <root_buffer B>
struct buffer_traits {
    using value_type = typename B::value_type;
    using size_type = std::size_t;
    using view_type = view_t<value_type>;

    [[nodiscard]] static size_type size(const B& buffer) noexcept {
        return static_cast<size_type>(buffer.size());
    }

    // Makes room for `additional` more elements.  Grows by at least 1.5x so
    // a run of partial normalisations stays amortised linear.
    static void reserve_additional(B& buffer, size_type additional) {
        if constexpr (requires { buffer.reserve(additional); buffer.capacity(); }) {
            const size_type required = size(buffer) + additional;
            const size_type capacity = static_cast<size_type>(buffer.capacity());
            if (required > capacity) {
                buffer.reserve(std::max(required, capacity + capacity / 2));
            }
        } else {
            (void)buffer;
            (void)additional;
        }
    }

    static void append(B& buffer, view_type chunk) {
        if (chunk.empty()) return;
        if constexpr (requires { buffer.append(chunk.data(), chunk.size()); }) {
            buffer.append(chunk.data(), chunk.size());
        } else {
            buffer.insert(buffer.end(), chunk.data(), chunk.data() + chunk.size());
        }
    }

    // Caller guarantees start <= end <= size(buffer).
    [[nodiscard]] static view_type slice(const B& buffer, size_type start, size_type end) noexcept {
        return view_type(buffer.data() + start, end - start);
    }

    [[nodiscard]] static view_type view(const B& buffer) noexcept {
        return slice(buffer, 0, size(buffer));
    }
};

}  // namespace lzc

#endif  // LZC_BUFFER_HPP
