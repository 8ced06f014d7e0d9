#include <iostream>
#include <string>
#include <vector>
#include "../include/lzc.hpp"

/// Basic lzc::lazy_concat usage examples
int main() {
    std::cout << "=== lzc library version " << lzc::version() << " ===" << std::endl << std::endl;

    // Example 1: Deferred concatenation
    {
        std::cout << "1. Deferred concatenation:" << std::endl;

        std::string there = "there";
        lzc::lazy_string lz;
        lz.concat("Hello").concat(" ").concat(there).concat(std::string("!"));

        std::cout << "  Logical length: " << lz.logical_length() << std::endl;
        std::cout << "  Materialised:   " << lz.materialized_length() << std::endl;
        std::cout << "  Pending:        " << lz.pending_fragments() << " fragments" << std::endl;
        std::cout << "  Debug:          " << lz.debug_string() << std::endl << std::endl;

        std::string result = std::move(lz).done();
        std::cout << "  Result: '" << result << "'" << std::endl << std::endl;
    }

    // Example 2: Consuming builder chain
    {
        std::cout << "2. Builder chain on a temporary:" << std::endl;

        std::string result = lzc::lazy_string(std::string("key"))
                                 .concat("=")
                                 .concat_copy(std::to_string(42))
                                 .concat(";")
                                 .done();
        std::cout << "  Result: '" << result << "'" << std::endl << std::endl;
    }

    // Example 3: Walking without materialising
    {
        std::cout << "3. Iteration leaves fragments pending:" << std::endl;

        lzc::lazy_string lz;
        lz += std::string_view("abc");
        lz += std::string("def");

        std::cout << "  Characters:";
        for (char c : lz.iterate()) {
            std::cout << ' ' << c;
        }
        std::cout << std::endl;
        std::cout << "  Still normal? " << (lz.is_normal() ? "yes" : "no") << std::endl << std::endl;
    }

    // Example 4: Element sequences
    {
        std::cout << "4. Integer sequence:" << std::endl;

        std::vector<int> head{1, 2, 3};
        lzc::lazy_vector<int> lz;
        lz.concat(head).concat(std::vector<int>{4, 5}).concat(head);

        std::cout << "  " << lz.debug_string() << std::endl;

        std::vector<int> result = std::move(lz).done();
        std::cout << "  Result size: " << result.size() << std::endl << std::endl;
    }

    std::cout << "=== All examples completed ===" << std::endl;
    return 0;
}
