#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/lzc.hpp"

/// Streaming a lazy_concat to output sinks without flattening it

namespace {

// Writes straight to a C stdio stream.
class stdio_sink : public lzc::output_sink {
public:
    explicit stdio_sink(std::FILE* file) noexcept : _file(file) {}

    using output_sink::write;

    void write(const char* data, std::size_t len) override {
        if (std::fwrite(data, 1, len, _file) != len) {
            throw std::runtime_error("stdio_sink: write failed");
        }
    }

    void flush() override {
        if (std::fflush(_file) != 0) {
            throw std::runtime_error("stdio_sink: flush failed");
        }
    }

private:
    std::FILE* _file;
};

// Collects everything into a string.
class string_sink : public lzc::output_sink {
public:
    using output_sink::write;

    void write(const char* data, std::size_t len) override { text.append(data, len); }

    std::string text;
};

}  // namespace

int main() {
    std::cout << "=== Sink Examples ===" << std::endl << std::endl;

    lzc::lazy_string report(std::string("status: "));
    report.concat("ok").concat(", items: ").concat(std::to_string(3)).concat("\n");

    // Example 1: Stream directly
    {
        std::cout << "1. operator<< writes each segment in turn:" << std::endl;
        std::cout << "  " << report;
        std::cout << "  Pending after output: " << report.pending_fragments() << std::endl << std::endl;
    }

    // Example 2: Collecting sink
    {
        std::cout << "2. Collecting into a string:" << std::endl;

        string_sink sink;
        lzc::write_to(sink, report);
        lzc::write_to(sink, report);
        std::cout << "  Collected " << sink.text.size() << " bytes" << std::endl << std::endl;
    }

    // Example 3: stdio sink
    {
        std::cout << "3. stdio sink:" << std::endl << std::flush;

        stdio_sink sink(stdout);
        sink.write("  ");
        std::size_t written = lzc::write_to(sink, report);
        sink.flush();
        std::cout << "  Wrote " << written << " bytes" << std::endl << std::endl;
    }

    std::cout << "=== All examples completed ===" << std::endl;
    return 0;
}
