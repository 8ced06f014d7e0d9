// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_DEBUG_ACCESS_TRACKER_HPP
#define LZC_DEBUG_ACCESS_TRACKER_HPP

// Debug-only access diagnostics for lzc containers.
//
// When LZC_DEBUG_ACCESS_CHECKS is enabled, every read, write, and move
// operation on a lazy_concat instance is tracked through an atomic state
// machine embedded in the object.  Overlapping access that breaks the
// single-writer contract, and any use of a container after it has been moved
// from or finalised with done(), is reported with a full diagnostic before
// aborting.
//
// In release builds the tracker compiles down to a zero-overhead stub so that
// none of this machinery affects production performance.

#include "lzc/config.hpp"

#if LZC_DEBUG_ACCESS_CHECKS

#include <atomic>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdio>
#include <cstdint>
#include <functional>

namespace lzc::debug {

// Categorises the kind of access being performed on a tracked object.  Values
// are distinct bits so they fit in the low byte of the packed state word.
enum class access_type : std::uint8_t {
    none  = 0,
    read  = 1,
    write = 2,
    moved = 4
};

// A snapshot of a single access event, stored in the diagnostic history.
struct access_record {
    std::thread::id thread_id;
    access_type type;
    std::chrono::steady_clock::time_point timestamp;
    const char* location;

    access_record(access_type t, const char* loc)
        : thread_id(std::this_thread::get_id()),
          type(t),
          timestamp(std::chrono::steady_clock::now()),
          location(loc) {}
};

// Per-instance tracker that detects access violations at runtime.
//
// The core mechanism is a single atomic uint32_t whose layout is:
//
//     [active access count : 24 bits][access type : 8 bits]
//
// Read access increments the count and sets the type to read.  Write access
// demands exclusive ownership (state must be zero).  A moved state is sticky:
// every later access is a use-after-move (or use-after-done) violation until
// the owner is assigned a new value and calls revive().
//
// Copying or moving a tracker produces a fresh idle tracker.  The tracker
// describes accesses to one object, never to the value it holds, so owners
// remain copyable and movable.
class alignas(64) access_tracker {
    std::atomic<std::uint32_t> _state{0};

    // Diagnostic history, guarded by its own mutex to keep it off the
    // lock-free hot path.
    mutable std::mutex _history_mutex;
    mutable std::vector<access_record> _history;

    static constexpr std::uint32_t TYPE_MASK = 0xFF;
    static constexpr std::uint32_t COUNT_SHIFT = 8;

public:
    access_tracker() {
#if LZC_DEBUG_ACCESS_HISTORY > 0
        _history.reserve(LZC_DEBUG_ACCESS_HISTORY);
#endif
    }

    access_tracker(const access_tracker&) : access_tracker() {}
    access_tracker(access_tracker&&) noexcept : access_tracker() {}
    access_tracker& operator=(const access_tracker&) noexcept { return *this; }
    access_tracker& operator=(access_tracker&&) noexcept { return *this; }

    // RAII guard returned by begin_read() and begin_write().  Destruction
    // releases the caller's slot in the state word.  Moves transfer
    // ownership; copies are prohibited.
    class access_guard {
        access_tracker* _tracker;

    public:
        explicit access_guard(access_tracker& tracker) noexcept
            : _tracker(&tracker) {}

        access_guard(const access_guard&) = delete;
        access_guard& operator=(const access_guard&) = delete;

        access_guard(access_guard&& other) noexcept
            : _tracker(other._tracker) {
            other._tracker = nullptr;
        }

        ~access_guard() {
            if (_tracker) {
                _tracker->end_access();
            }
        }
    };

    // Register a read access.  Concurrent reads are allowed; a read while a
    // write is active, or on a moved-from object, is a violation.
    [[nodiscard]] access_guard begin_read(const char* location) const {
        auto* self = const_cast<access_tracker*>(this);
        std::uint32_t old_state = _state.load(std::memory_order_acquire);

        while (true) {
            access_type type = static_cast<access_type>(old_state & TYPE_MASK);
            if (type == access_type::write || type == access_type::moved) {
                self->report_violation(access_type::read, old_state, location);
            }

            std::uint32_t count = old_state >> COUNT_SHIFT;
            std::uint32_t new_state = ((count + 1) << COUNT_SHIFT) | static_cast<std::uint32_t>(access_type::read);

            if (self->_state.compare_exchange_weak(old_state, new_state,
                                                   std::memory_order_release,
                                                   std::memory_order_acquire)) {
                break;
            }
        }

        record_access(access_type::read, location);
        return access_guard(*self);
    }

    // Register an exclusive write access.  The state must be idle; existing
    // readers, a writer, or the moved flag is a violation.
    [[nodiscard]] access_guard begin_write(const char* location) const {
        auto* self = const_cast<access_tracker*>(this);
        std::uint32_t old_state = _state.load(std::memory_order_acquire);

        if (old_state != 0) {
            self->report_violation(access_type::write, old_state, location);
        }

        std::uint32_t new_state = (1u << COUNT_SHIFT) | static_cast<std::uint32_t>(access_type::write);

        if (!self->_state.compare_exchange_strong(old_state, new_state,
                                                  std::memory_order_release,
                                                  std::memory_order_acquire)) {
            self->report_violation(access_type::write, old_state, location);
        }

        record_access(access_type::write, location);
        return access_guard(*self);
    }

    // Permanently mark the object as moved-from (or finalised).  Every
    // subsequent access is reported until revive() is called.
    void mark_moved(const char* location) {
        _state.store(static_cast<std::uint32_t>(access_type::moved), std::memory_order_release);
        record_access(access_type::moved, location);
    }

    // Returns a moved-from object to the idle state after it has been
    // assigned a fresh value.
    void revive() noexcept {
        _state.store(0, std::memory_order_release);
    }

    [[nodiscard]] bool is_moved() const noexcept {
        return static_cast<access_type>(_state.load(std::memory_order_acquire) & TYPE_MASK) == access_type::moved;
    }

private:
    // Decrement the active count.  When it drops to zero the type bits are
    // cleared too, returning the object to idle.  A moved state has a zero
    // count and is left untouched.
    void end_access() {
        std::uint32_t old_state = _state.load(std::memory_order_acquire);
        while (true) {
            std::uint32_t count = old_state >> COUNT_SHIFT;
            if (count == 0) break;

            std::uint32_t new_count = count - 1;
            std::uint32_t new_state = (new_count << COUNT_SHIFT);
            if (new_count > 0) {
                new_state |= (old_state & TYPE_MASK);
            }

            if (_state.compare_exchange_weak(old_state, new_state,
                                             std::memory_order_release,
                                             std::memory_order_acquire)) {
                break;
            }
        }
    }

    void record_access(access_type type, const char* location) const {
#if LZC_DEBUG_ACCESS_HISTORY > 0
        std::lock_guard<std::mutex> lock(_history_mutex);
        _history.emplace_back(type, location);
        if (_history.size() > LZC_DEBUG_ACCESS_HISTORY) {
            _history.erase(_history.begin());
        }
#else
        (void)type; (void)location;
#endif
    }

    // Print a diagnostic to stderr and abort.  The report includes the
    // attempted access, the conflicting state, and recent history.
    [[noreturn]] void report_violation(access_type attempted, std::uint32_t state, const char* loc) {
        std::lock_guard<std::mutex> lock(_history_mutex);

        access_type current = static_cast<access_type>(state & TYPE_MASK);
        std::uint32_t count = state >> COUNT_SHIFT;

        std::fprintf(stderr,
            "\n"
            "================================================================\n"
            "  LZC ACCESS VIOLATION DETECTED\n"
            "================================================================\n"
            "\n"
            "Attempted illegal access:\n"
            "  Type:      %s\n"
            "  Thread ID: %zu\n"
            "  Location:  %s\n"
            "\n"
            "Conflicting object state:\n"
            "  State type:   %s\n"
            "  Access count: %u\n"
            "\n",
            access_name(attempted),
            std::hash<std::thread::id>{}(std::this_thread::get_id()),
            loc ? loc : "unknown",
            access_name(current),
            count
        );

        if (current == access_type::moved) {
            std::fprintf(stderr,
                "The container was moved from or finalised with done(); it holds no\n"
                "value until it is assigned a new one.\n\n");
        }

#if LZC_DEBUG_ACCESS_HISTORY > 0
        if (!_history.empty()) {
            std::fprintf(stderr, "Recent access history (most recent last):\n");
            for (const auto& rec : _history) {
                std::fprintf(stderr, "  - Thread %zu: %s at %s\n",
                    std::hash<std::thread::id>{}(rec.thread_id),
                    access_name(rec.type),
                    rec.location ? rec.location : "unknown"
                );
            }
        }
#endif

        LZC_ACCESS_ABORT();
    }

    static const char* access_name(access_type t) {
        switch (t) {
            case access_type::none:  return "none";
            case access_type::read:  return "read";
            case access_type::write: return "write";
            case access_type::moved: return "moved";
            default:                 return "unknown";
        }
    }
};

} // namespace lzc::debug

#else // !LZC_DEBUG_ACCESS_CHECKS

namespace lzc::debug {

// Stub used when LZC_DEBUG_ACCESS_CHECKS is disabled.  Every method inlines
// to nothing; the interface mirrors the real tracker so calling code needs no
// preprocessor conditionals of its own.
class access_tracker {
public:
    struct access_guard {
        explicit access_guard(access_tracker&) noexcept {}
        access_guard(const access_guard&) = delete;
        access_guard(access_guard&&) = default;
    };

    access_tracker() = default;

    [[nodiscard]] access_guard begin_read(const char*) const { return access_guard(*const_cast<access_tracker*>(this)); }
    [[nodiscard]] access_guard begin_write(const char*) const { return access_guard(*const_cast<access_tracker*>(this)); }
    void mark_moved(const char*) noexcept {}
    void revive() noexcept {}
    [[nodiscard]] bool is_moved() const noexcept { return false; }
};

} // namespace lzc::debug

#endif // LZC_DEBUG_ACCESS_CHECKS

#endif // LZC_DEBUG_ACCESS_TRACKER_HPP
