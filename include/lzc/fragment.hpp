// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_FRAGMENT_HPP
#define LZC_FRAGMENT_HPP

// A single pending chunk of a lazy concatenation.

#include <cstddef>
#include <limits>
#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "lzc/buffer.hpp"

namespace lzc {

// One contiguous, read-only chunk waiting to be copied into a root buffer.
//
// A fragment either exclusively owns its data or borrows it.  Owned data is
// kept in a heap holder so the fragment's view stays valid when the fragment
// itself is moved around the queue.  Borrowed data is a plain view: the
// caller must keep the source alive until the fragment is materialised.
//
// Performance characteristics:
//   - borrowed(): O(1), no allocation.
//   - owned(): O(1), one holder allocation, the container is moved (its
//     elements are not copied; short strings living in an SSO buffer move
//     along with it).
//   - copied(): O(n) copy into a fresh owned container.
//
// Example usage:
//   auto a = lzc::fragment::borrowed("static text");
//   auto b = lzc::fragment::owned(std::string(1000, 'x'));
//   a.length();  // 11
template <typename T>
class basic_fragment_queue;

template <typename T>
class basic_fragment {
public:
    using value_type = T;
    using size_type = std::size_t;
    using view_type = view_t<T>;
    using const_iterator = typename view_type::iterator;

    // Container used when a fragment has to take a private copy.
    using copy_storage = std::conditional_t<is_character_v<T>,
                                            std::basic_string<T>,
                                            std::vector<T>>;

    basic_fragment() noexcept = default;

    basic_fragment(basic_fragment&& other) noexcept
        : _view(std::exchange(other._view, view_type())),
          _owner(std::move(other._owner)),
          _root_offset(std::exchange(other._root_offset, npos)) {}

    basic_fragment& operator=(basic_fragment&& other) noexcept {
        if (this != &other) {
            _view = std::exchange(other._view, view_type());
            _owner = std::move(other._owner);
            _root_offset = std::exchange(other._root_offset, npos);
        }
        return *this;
    }

    // Non-copyable: an owning fragment has exactly one owner.
    basic_fragment(const basic_fragment&) = delete;
    basic_fragment& operator=(const basic_fragment&) = delete;

    ~basic_fragment() noexcept = default;

    [[nodiscard]] static basic_fragment borrowed(view_type source) noexcept {
        return basic_fragment(source, nullptr);
    }

    // Takes ownership of an rvalue container without copying its elements.
    template <owning_source_of<T> C>
    requires (!std::is_lvalue_reference_v<C>)
    [[nodiscard]] static basic_fragment owned(C&& source) {
        auto holder = std::make_unique<owned_holder<std::remove_cvref_t<C>>>(std::move(source));
        view_type view(std::ranges::data(holder->storage), std::ranges::size(holder->storage));
        return basic_fragment(view, std::move(holder));
    }

    // Captures `source` by value, for callers that cannot keep it alive.
    [[nodiscard]] static basic_fragment copied(view_type source) {
        if (source.empty()) {
            return basic_fragment();
        }
        return owned(copy_storage(source.begin(), source.end()));
    }

    [[nodiscard]] size_type length() const noexcept { return _view.size(); }
    [[nodiscard]] size_type size() const noexcept { return _view.size(); }
    [[nodiscard]] bool empty() const noexcept { return _view.empty(); }

    [[nodiscard]] view_type view() const noexcept { return _view; }

    [[nodiscard]] const_iterator begin() const noexcept { return _view.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return _view.end(); }

    [[nodiscard]] bool owns_data() const noexcept { return _owner != nullptr; }

    // True when the fragment borrows the root buffer of the container it is
    // queued in.  Its view is then re-derived from the root whenever the
    // root's storage moves.
    [[nodiscard]] bool anchored_to_root() const noexcept { return _root_offset != npos; }

private:
    template <typename> friend class basic_fragment_queue;

    static constexpr size_type npos = std::numeric_limits<size_type>::max();

    struct holder {
        virtual ~holder() = default;
    };

    template <typename C>
    struct owned_holder final : holder {
        C storage;
        explicit owned_holder(C&& source) : storage(std::move(source)) {}
    };

    basic_fragment(view_type view, std::unique_ptr<holder> owner) noexcept
        : _view(view), _owner(std::move(owner)) {}

    view_type _view{};
    std::unique_ptr<holder> _owner{};
    size_type _root_offset = npos;
};

using fragment = basic_fragment<char>;

}  // namespace lzc

#endif  // LZC_FRAGMENT_HPP
