// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_LAZY_CONCAT_HPP
#define LZC_LAZY_CONCAT_HPP

// Deferred concatenation container for the lzc library.

#include <concepts>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include "lzc/config.hpp"
#include "lzc/buffer.hpp"
#include "lzc/range.hpp"
#include "lzc/fragment.hpp"
#include "lzc/fragment_queue.hpp"
#include "lzc/profiling.hpp"
#include "lzc/debug/access_tracker.hpp"

namespace lzc {

// Accumulates chunks destined for one contiguous buffer and postpones the
// copy until the data is actually needed.
//
// The container owns a materialised prefix (the root buffer) and a queue of
// pending fragments.  The logical value is always the root followed by every
// pending fragment in append order.  concat() only enqueues; reads decide how
// much gets copied:
//
//   - iterate() / begin() walk the logical sequence in place, copying nothing.
//   - get_slice() materialises the shortest run of whole fragments that
//     covers the requested end and leaves the rest pending.
//   - normalize() and done() materialise everything.
//
// The root only ever grows.  Data already in it is never rewritten, so
// normalisation is monotonic and irreversible.
//
// Performance characteristics:
//   - concat: O(1), no root growth, no copy of the fragment's data.
//   - logical_length: O(1).
//   - get_slice / normalize_to_len: O(k) for the k elements materialised.
//   - iteration: O(1) per element, no allocation.
//
// Lifetimes: borrowed fragments (views, lvalue containers, literals) must
// outlive the container while they are pending.  Views returned by
// get_slice() and iterators are invalidated by any later mutating call.
//
// In debug builds (LZC_DEBUG_ACCESS_CHECKS), every public member acquires a
// read or write guard that detects overlapping mutation and use after done().
//
// Example usage:
//   auto lz = lzc::lazy_string()
//                 .concat("Hello")
//                 .concat(" ")
//                 .concat(std::string("there!"));
//   lz.logical_length();            // 12, nothing copied yet.
//   lz.get_slice({1, 4});           // "ell", " " and "there!" still pending.
//   std::string s = std::move(lz).done();
template <root_buffer Root>
class lazy_concat {
    using traits = buffer_traits<Root>;

public:
    using root_type = Root;
    using value_type = typename Root::value_type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using view_type = view_t<value_type>;
    using fragment_type = basic_fragment<value_type>;
    using queue_type = basic_fragment_queue<value_type>;

    class const_iterator;
    class logical_view;
    using iterator = const_iterator;

    // ========== Construction ==========

    lazy_concat() : lazy_concat(Root{}) {}

    explicit lazy_concat(Root root) : _root(std::move(root)) {
        if constexpr (LZC_DEFAULT_FRAGMENT_RESERVE > 0) {
            _pending.reserve(LZC_DEFAULT_FRAGMENT_RESERVE);
        }
    }

    // Reserves queue space for `count` fragments up front.
    [[nodiscard]] static lazy_concat with_expected_fragments(Root root, size_type count) {
        lazy_concat result(std::move(root));
        result._pending.reserve(count);
        return result;
    }

    lazy_concat(lazy_concat&& other) noexcept(std::is_nothrow_move_constructible_v<Root>)
        : _root(std::move(other._root)), _pending(std::move(other._pending)) {
        [[maybe_unused]] auto _guard = other._guard_write(LZC_LOC);
        // Short roots live inline and change address on move.
        _pending.rebase(_root);
        other._ts.mark_moved(LZC_LOC);
    }

    lazy_concat& operator=(lazy_concat&& other) noexcept(std::is_nothrow_move_assignable_v<Root>) {
        if (this != &other) {
            [[maybe_unused]] auto other_guard = other._guard_write(LZC_LOC);
            _ts.revive();
            [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
            _root = std::move(other._root);
            _pending = std::move(other._pending);
            _pending.rebase(_root);
            other._ts.mark_moved(LZC_LOC);
        }
        return *this;
    }

    // Single owner: pending fragments may own data exclusively.
    lazy_concat(const lazy_concat&) = delete;
    lazy_concat& operator=(const lazy_concat&) = delete;

    ~lazy_concat() = default;

    // ========== Builder ==========
    //
    // The lvalue overloads append in place and return *this; the rvalue
    // overloads consume a temporary and pass it along, so both
    //   lz.concat(a).concat(b);
    // and
    //   auto lz = lzc::lazy_string().concat(a).concat(b);
    // work.  Every overload is O(1) and never throws except on allocation
    // failure of the queue itself.
    //
    // Borrowing from the container's own root (a view returned by
    // get_slice() or root()) is allowed: such fragments are tracked by offset
    // and stay valid when normalisation grows the root.

    lazy_concat& concat(fragment_type frag) & {
        [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
        if (const auto offset = _root_offset_of(frag)) {
            _pending.push_anchored(std::move(frag), *offset);
        } else {
            _pending.push(std::move(frag));
        }
        return *this;
    }

    lazy_concat&& concat(fragment_type frag) && {
        return std::move(concat(std::move(frag)));
    }

    // Borrows: `source` must stay alive until it has been materialised.
    lazy_concat& concat(view_type source) & {
        return concat(fragment_type::borrowed(source));
    }

    lazy_concat&& concat(view_type source) && {
        return std::move(concat(fragment_type::borrowed(source)));
    }

    // Takes ownership of an rvalue container; its elements are not copied.
    template <owning_source_of<value_type> C>
    requires (!std::is_lvalue_reference_v<C>)
    lazy_concat& concat(C&& source) & {
        return concat(fragment_type::owned(std::move(source)));
    }

    template <owning_source_of<value_type> C>
    requires (!std::is_lvalue_reference_v<C>)
    lazy_concat&& concat(C&& source) && {
        return std::move(concat(fragment_type::owned(std::move(source))));
    }

    // Captures `source` by value for callers that cannot guarantee its
    // lifetime.  O(n) in the size of `source`.
    lazy_concat& concat_copy(view_type source) & {
        return concat(fragment_type::copied(source));
    }

    lazy_concat&& concat_copy(view_type source) && {
        return std::move(concat(fragment_type::copied(source)));
    }

    lazy_concat& operator+=(fragment_type frag) { return concat(std::move(frag)); }
    lazy_concat& operator+=(view_type source) { return concat(source); }

    template <owning_source_of<value_type> C>
    requires (!std::is_lvalue_reference_v<C>)
    lazy_concat& operator+=(C&& source) {
        return concat(std::move(source));
    }

    // ========== Capacity ==========

    // Materialised length plus everything still pending.  O(1).
    [[nodiscard]] size_type logical_length() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return _logical_length();
    }

    [[nodiscard]] size_type size() const noexcept {
        return logical_length();
    }

    [[nodiscard]] bool empty() const noexcept {
        return logical_length() == 0;
    }

    [[nodiscard]] size_type materialized_length() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return traits::size(_root);
    }

    [[nodiscard]] size_type pending_length() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return _pending.total_pending_length();
    }

    [[nodiscard]] size_type pending_fragments() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return _pending.fragment_count();
    }

    // True when nothing is pending and the root holds the whole value.
    [[nodiscard]] bool is_normal() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return _pending.empty();
    }

    // The materialised prefix.  Does not include pending fragments.
    [[nodiscard]] const Root& root() const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return _root;
    }

    // ========== Normalisation ==========

    // Materialises every pending fragment.  Idempotent.
    void normalize() {
        [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
        _normalize_all();
    }

    // Materialises whole fragments until the root holds at least `n`
    // elements or nothing is pending.  A no-op when the root is already long
    // enough; `n` past logical_length() behaves like normalize().
    void normalize_to_len(size_type n) {
        [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
        _normalize_to(n);
    }

    // True iff serving `r` would need pending data, i.e. its resolved end
    // lies past the materialised prefix.
    [[nodiscard]] bool slice_needs_normalization(range r) const noexcept {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return r.resolve(_logical_length()).end > traits::size(_root);
    }

    [[nodiscard]] bool slice_needs_normalization(size_type start, size_type end) const noexcept {
        return slice_needs_normalization(range(start, end));
    }

    // ========== Slicing ==========

    // Returns a contiguous view of the logical range `r`, materialising only
    // the whole-fragment prefix needed to cover its end.  Fragments entirely
    // past the end stay pending.
    //
    // Throws std::out_of_range, without modifying the container, when the
    // end exceeds logical_length() or the start exceeds the end.
    [[nodiscard]] view_type get_slice(range r) {
        [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
        const auto b = _checked_bounds(r, "lzc::lazy_concat::get_slice");
        if (b.end > traits::size(_root)) {
            _normalize_to(b.end);
        }
        return traits::slice(_root, b.start, b.end);
    }

    [[nodiscard]] view_type get_slice(size_type start, size_type end) {
        return get_slice(range(start, end));
    }

    // Non-materialising fast path: the view when `r` already lies inside the
    // root, std::nullopt when it would need pending data.  Throws like
    // get_slice() for out-of-bounds ranges.
    [[nodiscard]] std::optional<view_type> peek_slice(range r) const {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        const auto b = _checked_bounds(r, "lzc::lazy_concat::peek_slice");
        if (b.end > traits::size(_root)) {
            return std::nullopt;
        }
        return traits::slice(_root, b.start, b.end);
    }

    // ========== Iteration ==========

    // Walks the logical sequence without materialising anything.  Every
    // call to begin() starts a fresh pass.
    [[nodiscard]] logical_view iterate() const noexcept {
        return logical_view(this);
    }

    [[nodiscard]] const_iterator begin() const {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return const_iterator(this, 0);
    }

    [[nodiscard]] const_iterator end() const {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        return const_iterator(this, _end_segment());
    }

    [[nodiscard]] const_iterator cbegin() const { return begin(); }
    [[nodiscard]] const_iterator cend() const { return end(); }

    // Calls fn(view_type) for the root and then for each pending fragment.
    // Empty segments are passed too.
    template <typename Fn>
    void for_each_segment(Fn&& fn) const {
        [[maybe_unused]] auto _guard = _guard_read(LZC_LOC);
        fn(traits::view(_root));
        _pending.for_each([&fn](const fragment_type& frag) { fn(frag.view()); });
    }

    // ========== Finalisation ==========

    // Materialises everything and hands back the root.  Consumes the
    // container: call as std::move(lz).done().
    [[nodiscard]] Root done() && {
        [[maybe_unused]] auto _guard = _guard_write(LZC_LOC);
        _normalize_all();
        Root result = std::move(_root);
        _ts.mark_moved(LZC_LOC);
        return result;
    }

    // ========== Diagnostics ==========

    // Renders root and pending fragments as
    //   lazy_concat { "root", "frag1", ... }
    // without materialising anything.
    [[nodiscard]] std::string debug_string() const {
        std::ostringstream out;
        out << "lazy_concat { ";
        bool first = true;
        for_each_segment([&](view_type segment) {
            if (!first) out << ", ";
            first = false;
            _write_segment(out, segment);
        });
        out << " }";
        return out.str();
    }

private:
    using _access_guard = debug::access_tracker::access_guard;

    _access_guard _guard_read(const char* loc) const {
        return _ts.begin_read(loc);
    }

    _access_guard _guard_write(const char* loc) const {
        return _ts.begin_write(loc);
    }

    [[nodiscard]] size_type _logical_length() const noexcept {
        return traits::size(_root) + _pending.total_pending_length();
    }

    // One past the last segment index.  Segment 0 is the root, segment k is
    // pending fragment k - 1.
    [[nodiscard]] size_type _end_segment() const noexcept {
        return _pending.fragment_count() + 1;
    }

    [[nodiscard]] view_type _segment_view(size_type segment) const noexcept {
        if (segment == 0) {
            return traits::view(_root);
        }
        return _pending[segment - 1].view();
    }

    // Offset of a borrowed fragment's data inside the root, if it lies there.
    [[nodiscard]] std::optional<size_type> _root_offset_of(const fragment_type& frag) const noexcept {
        if (frag.owns_data() || frag.empty()) {
            return std::nullopt;
        }
        const view_type root = traits::view(_root);
        const value_type* first = frag.view().data();
        const std::less_equal<const value_type*> before;
        if (before(root.data(), first) && before(first + frag.length(), root.data() + root.size())) {
            return static_cast<size_type>(first - root.data());
        }
        return std::nullopt;
    }

    [[nodiscard]] range::bounds _checked_bounds(range r, const char* where) const {
        const size_type length = _logical_length();
        const auto b = r.resolve(length);
        if (b.end > length) {
            throw std::out_of_range(std::string(where) + ": range end " +
                                    std::to_string(b.end) + " exceeds logical length " +
                                    std::to_string(length));
        }
        if (b.start > b.end) {
            throw std::out_of_range(std::string(where) + ": range start " +
                                    std::to_string(b.start) + " exceeds range end " +
                                    std::to_string(b.end));
        }
        return b;
    }

    void _normalize_all() {
        if (_pending.empty()) return;
        profiler prof("lazy_concat::normalize");
        prof.count(_pending.materialize_all(_root));
    }

    void _normalize_to(size_type n) {
        const size_type materialized = traits::size(_root);
        if (materialized >= n || _pending.empty()) return;
        profiler prof("lazy_concat::normalize_to_len");
        prof.count(_pending.materialize_front_until(_root, n - materialized));
    }

    static void _write_segment(std::ostringstream& out, view_type segment) {
        if constexpr (std::same_as<value_type, char>) {
            out << std::quoted(segment);
        } else if constexpr (requires(std::ostream& os, const value_type& v) { os << v; }) {
            out << '[';
            bool first = true;
            for (const auto& element : segment) {
                if (!first) out << ", ";
                first = false;
                out << element;
            }
            out << ']';
        } else {
            out << '<' << segment.size() << " elements>";
        }
    }

    Root _root;
    queue_type _pending;
    [[no_unique_address]] mutable debug::access_tracker _ts;
};

// Forward iterator over the logical sequence of a lazy_concat.
//
// A two-phase cursor: it first walks the root buffer, then each pending
// fragment element by element.  Empty segments are skipped.  The iterator
// reads the container in place and is invalidated by any mutating call.
template <root_buffer Root>
class lazy_concat<Root>::const_iterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using iterator_concept = std::forward_iterator_tag;
    using value_type = typename lazy_concat::value_type;
    using difference_type = std::ptrdiff_t;
    using reference = const value_type&;
    using pointer = const value_type*;

    const_iterator() noexcept = default;

    [[nodiscard]] reference operator*() const noexcept {
        return _current[_offset];
    }

    [[nodiscard]] pointer operator->() const noexcept {
        return &_current[_offset];
    }

    const_iterator& operator++() noexcept {
        if (++_offset == _current.size()) {
            ++_segment;
            _offset = 0;
            _skip_empty_segments();
        }
        return *this;
    }

    const_iterator operator++(int) noexcept {
        const_iterator previous = *this;
        ++*this;
        return previous;
    }

    [[nodiscard]] bool operator==(const const_iterator& other) const noexcept {
        return _segment == other._segment && _offset == other._offset;
    }

private:
    friend class lazy_concat;

    const_iterator(const lazy_concat* owner, size_type segment) noexcept
        : _owner(owner), _segment(segment) {
        _skip_empty_segments();
    }

    // Leaves the cursor on the first non-empty segment at or after the
    // current one, or on the end position.
    void _skip_empty_segments() noexcept {
        const size_type end_segment = _owner->_end_segment();
        while (_segment < end_segment) {
            _current = _owner->_segment_view(_segment);
            if (!_current.empty()) return;
            ++_segment;
        }
        _segment = end_segment;
        _current = view_type();
    }

    const lazy_concat* _owner = nullptr;
    size_type _segment = 0;
    size_type _offset = 0;
    view_type _current{};
};

// Restartable view returned by lazy_concat::iterate().
template <root_buffer Root>
class lazy_concat<Root>::logical_view {
public:
    [[nodiscard]] const_iterator begin() const { return _owner->begin(); }
    [[nodiscard]] const_iterator end() const { return _owner->end(); }

    [[nodiscard]] size_type size() const noexcept { return _owner->logical_length(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    friend class lazy_concat;

    explicit logical_view(const lazy_concat* owner) noexcept : _owner(owner) {}

    const lazy_concat* _owner;
};

// ============================================================================
// Deduction guides, aliases and stream output.
// ============================================================================

lazy_concat(const char*) -> lazy_concat<std::string>;
lazy_concat(std::string_view) -> lazy_concat<std::string>;

using lazy_string = lazy_concat<std::string>;

template <typename T>
using lazy_vector = lazy_concat<std::vector<T>>;

// Writes the logical sequence without materialising it.
template <root_buffer Root>
requires std::same_as<typename Root::value_type, char>
std::ostream& operator<<(std::ostream& os, const lazy_concat<Root>& lz) {
    lz.for_each_segment([&os](std::string_view segment) {
        os.write(segment.data(), static_cast<std::streamsize>(segment.size()));
    });
    return os;
}

}  // namespace lzc

#endif  // LZC_LAZY_CONCAT_HPP
