// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef LZC_SINKS_HPP
#define LZC_SINKS_HPP

// Output sink interface for streaming a text lazy_concat to a destination
// segment by segment, without materialising it.

#include <concepts>
#include <cstddef>
#include <string_view>
#include "lzc/lazy_concat.hpp"

namespace lzc {

// Destination for write_to().  Implementations report failures by throwing;
// write_to() lets the exception propagate with the container untouched.
class output_sink {
public:
    virtual ~output_sink() = default;

    virtual void write(const char* data, std::size_t len) = 0;

    // Flushes any buffered data. The default implementation is a no-op.
    virtual void flush() {}

    void write(std::string_view chunk) {
        write(chunk.data(), chunk.size());
    }
};

// Streams the logical sequence of `lz` into `sink`: the root first, then each
// pending fragment.  Nothing is materialised.  Returns the number of bytes
// written.
template <root_buffer Root>
requires std::same_as<typename Root::value_type, char>
std::size_t write_to(output_sink& sink, const lazy_concat<Root>& lz) {
    std::size_t written = 0;
    lz.for_each_segment([&](std::string_view segment) {
        if (segment.empty()) return;
        sink.write(segment.data(), segment.size());
        written += segment.size();
    });
    return written;
}

}  // namespace lzc

#endif  // LZC_SINKS_HPP
