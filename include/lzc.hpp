// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_HPP
#define LZC_HPP

// Umbrella header for the lzc library.  Including this single header pulls in
// every public component: fragments, the fragment queue, the lazy_concat
// container, slicing ranges, and output sinks.

#include "lzc/config.hpp"
#include "lzc/buffer.hpp"
#include "lzc/range.hpp"
#include "lzc/fragment.hpp"
#include "lzc/fragment_queue.hpp"
#include "lzc/lazy_concat.hpp"
#include "lzc/sinks.hpp"

namespace lzc {
    constexpr int MAJOR_VERSION = 1;
    constexpr int MINOR_VERSION = 0;
    constexpr int PATCH_VERSION = 0;

    // Returns the library version as a human-readable string.
    inline const char* version() noexcept {
        return "1.0.0";
    }
}

#endif  // LZC_HPP
