// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_FRAGMENT_QUEUE_HPP
#define LZC_FRAGMENT_QUEUE_HPP

// Ordered queue of pending fragments with running length bookkeeping.

#include <cassert>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>
#include "lzc/buffer.hpp"
#include "lzc/fragment.hpp"

namespace lzc {

// FIFO of fragments in logical order.
//
// Fragments are stored in a vector with a moving head index: popping the
// front is O(1) and the consumed prefix is compacted away once it dominates
// the vector.  A consumed slot is reset immediately so owned data is freed
// as soon as it has been copied out.
//
// Materialisation always consumes whole fragments.  Stopping mid-fragment
// would need element-boundary-aware partial copies (and could cut a
// multi-byte code point in half), so a request may overshoot by up to one
// fragment.
//
// A fragment may borrow the root it will be appended to (for example a slice
// previously returned from that root).  Such fragments are pushed with
// push_anchored() and keep their offset into the root; the queue re-slices
// them whenever the root's storage may have moved, so they never read freed
// memory.
//
// Invariant: total_pending_length() == sum of length() over queued fragments.
template <typename T>
class basic_fragment_queue {
public:
    using value_type = T;
    using size_type = std::size_t;
    using fragment_type = basic_fragment<T>;
    using view_type = view_t<T>;

    basic_fragment_queue() noexcept = default;

    basic_fragment_queue(basic_fragment_queue&& other) noexcept
        : _fragments(std::move(other._fragments)),
          _head(std::exchange(other._head, 0)),
          _total(std::exchange(other._total, 0)),
          _anchored(std::exchange(other._anchored, 0)) {
        other._fragments.clear();
    }

    basic_fragment_queue& operator=(basic_fragment_queue&& other) noexcept {
        if (this != &other) {
            _fragments = std::move(other._fragments);
            _head = std::exchange(other._head, 0);
            _total = std::exchange(other._total, 0);
            _anchored = std::exchange(other._anchored, 0);
            other._fragments.clear();
        }
        return *this;
    }

    basic_fragment_queue(const basic_fragment_queue&) = delete;
    basic_fragment_queue& operator=(const basic_fragment_queue&) = delete;

    // Capacity hint for `count` more fragments.
    void reserve(size_type count) {
        _fragments.reserve(_fragments.size() + count);
    }

    void push(fragment_type frag) {
        _total += frag.length();
        _fragments.push_back(std::move(frag));
    }

    // Queues a borrowed fragment whose data lies in the root buffer, starting
    // at `root_offset`.  The root only grows, so the offset stays valid.
    void push_anchored(fragment_type frag, size_type root_offset) {
        frag._root_offset = root_offset;
        push(std::move(frag));
        ++_anchored;
    }

    // Re-derives the views of anchored fragments from `root`.  Must be called
    // after anything that may relocate the root's storage.
    template <root_buffer B>
    requires std::same_as<typename B::value_type, T>
    void rebase(const B& root) noexcept {
        if (_anchored == 0) return;
        for (size_type i = _head; i < _fragments.size(); ++i) {
            fragment_type& frag = _fragments[i];
            if (frag.anchored_to_root()) {
                frag._view = _anchored_view(root, frag);
            }
        }
    }

    [[nodiscard]] size_type total_pending_length() const noexcept { return _total; }
    [[nodiscard]] bool empty() const noexcept { return _head == _fragments.size(); }
    [[nodiscard]] size_type fragment_count() const noexcept { return _fragments.size() - _head; }

    // i-th pending fragment, 0 being the next one to materialise.
    [[nodiscard]] const fragment_type& operator[](size_type i) const noexcept {
        assert(i < fragment_count());
        return _fragments[_head + i];
    }

    [[nodiscard]] const fragment_type& front() const noexcept {
        assert(!empty());
        return _fragments[_head];
    }

    // Calls fn(const fragment_type&) for each pending fragment, front first.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (size_type i = _head; i < _fragments.size(); ++i) {
            fn(_fragments[i]);
        }
    }

    // Pops whole fragments from the front into `root` until at least
    // `target_additional_length` elements were appended or the queue is
    // empty.  Returns the number of elements appended.
    template <root_buffer B>
    requires std::same_as<typename B::value_type, T>
    size_type materialize_front_until(B& root, size_type target_additional_length) {
        size_type needed = 0;
        size_type last = _head;
        while (last < _fragments.size() && needed < target_additional_length) {
            needed += _fragments[last].length();
            ++last;
        }
        return _materialize_through(root, last, needed);
    }

    // Drains every pending fragment into `root`, in order.  Returns the number
    // of elements appended.
    template <root_buffer B>
    requires std::same_as<typename B::value_type, T>
    size_type materialize_all(B& root) {
        return _materialize_through(root, _fragments.size(), _total);
    }

    // Drops every pending fragment without materialising it.
    void clear() noexcept {
        _fragments.clear();
        _head = 0;
        _total = 0;
        _anchored = 0;
    }

private:
    // Consumed slots are compacted away past this many once they make up at
    // least half of the vector.
    static constexpr size_type kCompactThreshold = 32;

    // Appends fragments [_head, last) to root.  `expected` is their total
    // length, reserved up front so the root grows at most once per call.
    template <root_buffer B>
    size_type _materialize_through(B& root, size_type last, size_type expected) {
        if (_head == last) {
            return 0;
        }
        using traits = buffer_traits<B>;
        traits::reserve_additional(root, expected);

        size_type appended = 0;
        try {
            while (_head < last) {
                fragment_type& frag = _fragments[_head];
                const size_type len = frag.length();
                const bool anchored = frag.anchored_to_root();
                // Pop only once the copy succeeded: if append throws, the
                // fragment is still pending and the length invariant holds.
                traits::append(root, anchored ? _anchored_view(root, frag) : frag.view());
                appended += len;
                _total -= len;
                if (anchored) --_anchored;
                frag = fragment_type();
                ++_head;
            }
        } catch (...) {
            // The root may have been relocated before the failing append.
            rebase(root);
            throw;
        }
        _compact();
        rebase(root);
        return appended;
    }

    template <root_buffer B>
    static view_type _anchored_view(const B& root, const fragment_type& frag) noexcept {
        return buffer_traits<B>::slice(root, frag._root_offset, frag._root_offset + frag.length());
    }

    void _compact() {
        if (_head == _fragments.size()) {
            _fragments.clear();
            _head = 0;
        } else if (_head >= kCompactThreshold && _head * 2 >= _fragments.size()) {
            _fragments.erase(_fragments.begin(),
                             _fragments.begin() + static_cast<std::ptrdiff_t>(_head));
            _head = 0;
        }
    }

    std::vector<fragment_type> _fragments;
    size_type _head = 0;
    size_type _total = 0;
    size_type _anchored = 0;
};

}  // namespace lzc

#endif  // LZC_FRAGMENT_QUEUE_HPP
