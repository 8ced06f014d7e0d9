#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/lzc.hpp"

/// Slicing and normalisation examples
int main() {
    std::cout << "=== Slicing Examples ===" << std::endl << std::endl;

    // Example 1: Minimal normalisation
    {
        std::cout << "1. A slice materialises only what it covers:" << std::endl;

        lzc::lazy_string lz;
        lz.concat("alpha ").concat("beta ").concat("gamma ").concat("delta");

        auto slice = lz.get_slice(2, 8);
        std::cout << "  get_slice(2, 8): '" << slice << "'" << std::endl;
        std::cout << "  Materialised: " << lz.materialized_length()
                  << " of " << lz.logical_length() << std::endl;
        std::cout << "  Pending fragments: " << lz.pending_fragments() << std::endl << std::endl;
    }

    // Example 2: Range forms
    {
        std::cout << "2. Range forms:" << std::endl;

        lzc::lazy_string lz(std::string("0123"));
        lz.concat("4567").concat("89");

        std::cout << "  [2, 5):   '" << lz.get_slice(lzc::range(2, 5)) << "'" << std::endl;
        std::cout << "  [2, 5]:   '" << lz.get_slice(lzc::range::inclusive(2, 5)) << "'" << std::endl;
        std::cout << "  [..3):    '" << lz.get_slice(lzc::range::to(3)) << "'" << std::endl;
        std::cout << "  [7..):    '" << lz.get_slice(lzc::range::from(7)) << "'" << std::endl << std::endl;
    }

    // Example 3: Two-step protocol
    {
        std::cout << "3. Check, normalise, then read without mutation:" << std::endl;

        lzc::lazy_string lz(std::string("ready"));
        lz.concat("-pending");

        if (auto fast = lz.peek_slice({0, 5})) {
            std::cout << "  Fast path: '" << *fast << "'" << std::endl;
        }
        if (lz.slice_needs_normalization(0, 8)) {
            lz.normalize_to_len(8);
        }
        std::cout << "  After normalize_to_len(8): '" << lz.peek_slice({0, 8}).value() << "'" << std::endl << std::endl;
    }

    // Example 4: Bounds checking
    {
        std::cout << "4. Out-of-range requests throw:" << std::endl;

        lzc::lazy_string lz;
        lz.concat("short");
        try {
            (void)lz.get_slice(0, 100);
        } catch (const std::out_of_range& e) {
            std::cout << "  Caught: " << e.what() << std::endl;
        }
        std::cout << "  Container unchanged: " << lz.pending_fragments() << " pending" << std::endl << std::endl;
    }

    std::cout << "=== All examples completed ===" << std::endl;
    return 0;
}
