// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_RANGE_HPP
#define LZC_RANGE_HPP

// Index ranges for slicing a lazy_concat.
//
// A range may leave its end unbounded ("to the end of the logical
// sequence"), so it is resolved against a length before use.

#include <cstddef>
#include <limits>

namespace lzc {

// Half-open [start, end) index range with an optionally unbounded end.
//
// Example usage:
//   lz.get_slice({1, 4});                    // [1, 4)
//   lz.get_slice(lzc::range::inclusive(0, 2)); // [0, 3)
//   lz.get_slice(lzc::range::from(6));       // [6, logical_length())
class range {
public:
    using size_type = std::size_t;

    // Start and end after resolving an unbounded end against a length.
    struct bounds {
        size_type start;
        size_type end;

        [[nodiscard]] constexpr size_type size() const noexcept {
            return end >= start ? end - start : 0;
        }
    };

    constexpr range() noexcept = default;

    constexpr range(size_type start, size_type end) noexcept
        : _start(start), _end(end), _bounded(true) {}

    // [first, last].  A last index of SIZE_MAX cannot be made half-open; it
    // saturates to a bounded end of SIZE_MAX, which no sequence reaches.
    [[nodiscard]] static constexpr range inclusive(size_type first, size_type last) noexcept {
        return range(first, last == std::numeric_limits<size_type>::max() ? last : last + 1);
    }

    [[nodiscard]] static constexpr range from(size_type start) noexcept {
        range r;
        r._start = start;
        return r;
    }

    [[nodiscard]] static constexpr range to(size_type end) noexcept {
        return range(0, end);
    }

    [[nodiscard]] static constexpr range to_inclusive(size_type last) noexcept {
        return inclusive(0, last);
    }

    [[nodiscard]] static constexpr range all() noexcept {
        return range();
    }

    [[nodiscard]] constexpr size_type start() const noexcept { return _start; }

    // Raw end; meaningful only when has_bounded_end().
    [[nodiscard]] constexpr size_type end() const noexcept { return _end; }

    [[nodiscard]] constexpr bool has_bounded_end() const noexcept {
        return _bounded;
    }

    [[nodiscard]] constexpr bounds resolve(size_type length) const noexcept {
        return bounds{_start, has_bounded_end() ? _end : length};
    }

    [[nodiscard]] constexpr bool operator==(const range&) const noexcept = default;

private:
    size_type _start = 0;
    size_type _end = 0;
    bool _bounded = false;
};

}  // namespace lzc

#endif  // LZC_RANGE_HPP
