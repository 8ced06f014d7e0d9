// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_PROFILING_HPP
#define LZC_PROFILING_HPP

// Optional scoped profiler for the lzc library.
//
// Define LZC_ENABLE_PROFILING before including this header to log how long
// each materialising operation takes, and how many elements it copied, to
// std::clog.  When the macro is not defined the profiler compiles to a
// zero-cost no-op.

#include <cstddef>
#include <string>
#include <string_view>

#ifdef LZC_ENABLE_PROFILING

#include <chrono>
#include <iostream>

namespace lzc {
class profiler {
public:
    explicit profiler(std::string_view label)
        : _label(label), _start(std::chrono::high_resolution_clock::now()) {}

    ~profiler() {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        std::clog << "[lzc::profiler] " << _label << " took " << duration << " us";
        if (_elements != 0) {
            std::clog << " (" << _elements << " elements)";
        }
        std::clog << '\n';
    }

    profiler(const profiler&) = delete;
    profiler& operator=(const profiler&) = delete;

    // Adds to the element count reported when the scope closes.
    void count(std::size_t elements) noexcept { _elements += elements; }

private:
    std::string _label;
    std::chrono::high_resolution_clock::time_point _start;
    std::size_t _elements = 0;
};
}

#else  // LZC_ENABLE_PROFILING

namespace lzc {
class profiler {
public:
    constexpr explicit profiler(const char*) noexcept {}
    constexpr explicit profiler(std::string_view) noexcept {}
    ~profiler() noexcept = default;

    constexpr void count(std::size_t) noexcept {}
};
}

#endif  // LZC_ENABLE_PROFILING

#endif  // LZC_PROFILING_HPP
