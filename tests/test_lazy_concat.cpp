#include <lzc/lazy_concat.hpp>
#include <array>
#include <iostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

int main() {
    // Hello there: lengths, iteration, partial slice, finalisation
    {
        lzc::lazy_concat lz("");
        lz.concat("Hello").concat(" ").concat("there!");

        TEST(lz.logical_length() == 12, "hello: logical length");
        TEST(lz.materialized_length() == 0, "hello: nothing materialised by concat");
        TEST(lz.pending_fragments() == 3, "hello: three fragments pending");

        std::string walked;
        for (char c : lz.iterate()) walked.push_back(c);
        TEST(walked == "Hello there!", "hello: iterate yields every character in order");
        TEST(lz.materialized_length() == 0, "hello: iterate does not materialise");

        TEST(lz.get_slice(1, 4) == "ell", "hello: get_slice(1, 4)");
        TEST(lz.root() == "Hello", "hello: only the first fragment was materialised");
        TEST(lz.pending_fragments() == 2, "hello: later fragments still pending");
        TEST(lz.slice_needs_normalization(6, 12), "hello: 'there!' still pending");

        std::string result = std::move(lz).done();
        TEST(result == "Hello there!", "hello: done returns the joined string");
    }

    // Integer fragments borrowed from a larger array, skipping [2, 10)
    {
        std::array<int, 12> data{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
        lzc::lazy_vector<int> lz;
        lz.concat(std::span<const int>(data).subspan(0, 2))
          .concat(std::span<const int>(data).subspan(10, 2));

        std::vector<int> walked(lz.begin(), lz.end());
        TEST((walked == std::vector<int>{0, 1, 10, 11}), "ints: iterate yields 0,1,10,11");
        TEST(lz.logical_length() == 4, "ints: logical length");

        std::vector<int> result = std::move(lz).done();
        TEST((result == std::vector<int>{0, 1, 10, 11}), "ints: done returns 0,1,10,11");
    }

    // Logical length is the initial root plus every fragment, nothing copied
    {
        std::string a = "alpha";
        std::string b = "beta";
        lzc::lazy_string lz(std::string("root:"));
        lz.concat(a).concat(b).concat(std::string(100, 'x')).concat("");
        TEST(lz.logical_length() == 5 + 5 + 4 + 100, "length: sum of root and fragments");
        TEST(lz.root() == "root:", "length: root untouched by concat");
        TEST(lz.pending_length() == 109, "length: pending length tracks fragments");
        TEST(lz.pending_fragments() == 4, "length: empty fragment is still queued");
        TEST(!lz.is_normal(), "length: not normal while fragments pend");
    }

    // Consuming builder chain
    {
        auto lz = lzc::lazy_string()
                      .concat("one")
                      .concat(std::string(", two"))
                      .concat_copy(std::string_view(", three"));
        TEST(lz.logical_length() == 15, "builder: chained length");
        TEST(std::move(lz).done() == "one, two, three", "builder: chained result");
    }

    // operator+= is the in-place form
    {
        lzc::lazy_string lz;
        lz += "abc";
        lz += std::string("def");
        lz += lzc::fragment::borrowed("ghi");
        TEST(lz.logical_length() == 9, "plus-equals: length");
        TEST(std::move(lz).done() == "abcdefghi", "plus-equals: result");
    }

    // normalize is complete, transparent and idempotent
    {
        lzc::lazy_string lz(std::string("x"));
        lz.concat("yy").concat("zzz");

        std::string before(lz.begin(), lz.end());
        lz.normalize();
        TEST(lz.is_normal(), "normalize: queue drained");
        TEST(lz.root() == "xyyzzz", "normalize: root holds everything");
        std::string after(lz.begin(), lz.end());
        TEST(before == after, "normalize: iteration unchanged");

        const std::string root_before = lz.root();
        const auto length_before = lz.logical_length();
        lz.normalize();
        TEST(lz.root() == root_before, "normalize: second call leaves root unchanged");
        TEST(lz.logical_length() == length_before, "normalize: second call leaves length unchanged");
    }

    // normalize_to_len consumes whole fragments only and saturates
    {
        lzc::lazy_string lz;
        lz.concat("abcd").concat("efgh").concat("ijkl");

        lz.normalize_to_len(0);
        TEST(lz.materialized_length() == 0, "normalize_to_len: zero is a no-op");

        lz.normalize_to_len(5);
        TEST(lz.root() == "abcdefgh", "normalize_to_len: overshoots to a fragment boundary");
        TEST(lz.pending_fragments() == 1, "normalize_to_len: last fragment untouched");

        lz.normalize_to_len(3);
        TEST(lz.root() == "abcdefgh", "normalize_to_len: already long enough is a no-op");

        lz.normalize_to_len(1000);
        TEST(lz.is_normal(), "normalize_to_len: past the end behaves like normalize");
        TEST(lz.root() == "abcdefghijkl", "normalize_to_len: full result");
    }

    // Appending after a partial normalisation keeps the logical order
    {
        lzc::lazy_string lz;
        lz.concat("one ");
        TEST(lz.get_slice(0, 3) == "one", "interleave: first slice");
        lz.concat("two ").concat("three");
        TEST(lz.logical_length() == 13, "interleave: length after more concat");
        std::string walked(lz.begin(), lz.end());
        TEST(walked == "one two three", "interleave: iteration after partial normalise");
        TEST(std::move(lz).done() == "one two three", "interleave: done");
    }

    // iterate() matches done() on an equivalent fresh container
    {
        const std::vector<std::string> parts = {"", "a", "", "bc", "def", "", "ghij"};
        for (std::size_t split = 0; split <= parts.size(); ++split) {
            lzc::lazy_string walked_lz(std::string("^"));
            lzc::lazy_string done_lz(std::string("^"));
            for (const auto& p : parts) {
                walked_lz.concat(p);
                done_lz.concat(p);
            }
            walked_lz.normalize_to_len(split * 2);
            std::string walked(walked_lz.begin(), walked_lz.end());
            std::string joined = std::move(done_lz).done();
            TEST(walked == joined, "equivalence: iterate equals done");
        }
    }

    // Restartable, non-mutating iteration
    {
        lzc::lazy_string lz(std::string("ab"));
        lz.concat("cd");
        auto view = lz.iterate();
        std::string first(view.begin(), view.end());
        std::string second(view.begin(), view.end());
        TEST(first == "abcd" && second == "abcd", "iterate: each pass starts fresh");
        TEST(view.size() == 4, "iterate: view reports logical length");
        TEST(lz.pending_fragments() == 1, "iterate: container not mutated");
    }

    // Expected fragment count is only a capacity hint
    {
        auto lz = lzc::lazy_string::with_expected_fragments(std::string("["), 16);
        for (int i = 0; i < 16; ++i) lz.concat("..");
        lz.concat("]");
        TEST(lz.logical_length() == 34, "expected fragments: length");
        TEST(lz.pending_fragments() == 17, "expected fragments: all queued");
    }

    // Many partial normalisations compact the queue without losing order
    {
        lzc::lazy_string lz;
        std::string expected;
        std::vector<std::string> chunks;
        for (int i = 0; i < 200; ++i) {
            chunks.push_back(std::to_string(i) + ",");
        }
        for (const auto& c : chunks) {
            lz.concat(c);
            expected += c;
        }
        for (std::size_t n = 1; n < expected.size(); n += 7) {
            lz.normalize_to_len(n);
            TEST(lz.logical_length() == expected.size(), "compaction: length stable");
        }
        std::string walked(lz.begin(), lz.end());
        TEST(walked == expected, "compaction: iteration after many partial normalisations");
        TEST(std::move(lz).done() == expected, "compaction: done after many partial normalisations");
    }

    // Move construction and assignment transfer root and pending fragments
    {
        lzc::lazy_string a(std::string("left"));
        a.concat("-right");
        lzc::lazy_string b(std::move(a));
        TEST(b.logical_length() == 10, "move: constructed length");

        lzc::lazy_string c;
        c = std::move(b);
        TEST(c.pending_fragments() == 1, "move: assigned pending");
        TEST(std::move(c).done() == "left-right", "move: assigned result");
    }

    // Borrowing a slice of the container's own root survives root growth
    {
        lzc::lazy_string lz(std::string(20, 'a'));
        lz.concat(lz.get_slice(0, 20)).concat(std::string(100, 'b'));
        TEST(lz.logical_length() == 140, "self-borrow: length");
        std::string result = std::move(lz).done();
        TEST(result == std::string(40, 'a') + std::string(100, 'b'), "self-borrow: slice re-read after reallocation");
    }

    // A short root borrowed whole, then the container is moved
    {
        lzc::lazy_string lz(std::string("ab"));
        lz.concat(lz.root());
        lzc::lazy_string moved(std::move(lz));
        std::string walked(moved.begin(), moved.end());
        TEST(walked == "abab", "self-borrow: iteration after move construction");

        lzc::lazy_string assigned;
        assigned = std::move(moved);
        TEST(assigned.debug_string() == "lazy_concat { \"ab\", \"ab\" }", "self-borrow: view after move assignment");
        TEST(std::move(assigned).done() == "abab", "self-borrow: done after moves");
    }

    // Root-borrowing fragments left pending through a partial normalisation
    {
        lzc::lazy_string lz(std::string("xy"));
        lz.concat(std::string(50, 'z'));
        lz.concat(lz.root()).concat(lz.get_slice(0, 1));
        const std::string expected = "xy" + std::string(50, 'z') + "xy" + "x";

        lz.normalize_to_len(3);
        TEST(lz.materialized_length() == 52, "self-borrow: first fragment materialised");
        TEST(lz.pending_fragments() == 2, "self-borrow: root borrows still pending");
        std::string walked(lz.begin(), lz.end());
        TEST(walked == expected, "self-borrow: pending views follow the grown root");
        TEST(lz.get_slice(51, 54) == "zxy", "self-borrow: slice across the borrowed region");
        TEST(std::move(lz).done() == expected, "self-borrow: done");
    }

    std::cout << "\nAll lazy_concat tests passed!\n";
    return 0;
}
