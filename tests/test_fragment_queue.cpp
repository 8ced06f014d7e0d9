#include <lzc/fragment.hpp>
#include <lzc/fragment_queue.hpp>
#include <iostream>
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
    // Borrowed fragments view the caller's data directly
    {
        std::string source = "borrowed text";
        auto frag = lzc::fragment::borrowed(source);
        TEST(frag.length() == source.size(), "borrowed: length");
        TEST(frag.view().data() == source.data(), "borrowed: no copy");
        TEST(!frag.owns_data(), "borrowed: does not own");
    }

    // Owned fragments keep the moved-in buffer, elements are not copied
    {
        std::string source(4096, 'q');
        const char* original_data = source.data();
        auto frag = lzc::fragment::owned(std::move(source));
        TEST(frag.length() == 4096, "owned: length");
        TEST(frag.owns_data(), "owned: owns");
        TEST(frag.view().data() == original_data, "owned: heap buffer moved, not copied");

        // Moving the fragment keeps its view valid.
        auto moved = std::move(frag);
        TEST(moved.view().data() == original_data, "owned: view survives fragment move");
        TEST(moved.view() == std::string(4096, 'q'), "owned: contents intact");
        TEST(frag.empty(), "owned: moved-from fragment is empty");
    }

    // Short strings live in the SSO buffer and move into the holder
    {
        auto frag = lzc::fragment::owned(std::string("tiny"));
        auto moved = std::move(frag);
        TEST(moved.view() == "tiny", "owned: SSO string contents survive");
    }

    // Copied fragments are independent of the source
    {
        std::string source = "volatile";
        auto frag = lzc::fragment::copied(source);
        source.assign("XXXXXXXX");
        TEST(frag.view() == "volatile", "copied: independent of source");
        TEST(frag.owns_data(), "copied: owns");
        TEST(lzc::fragment::copied(std::string_view()).empty(), "copied: empty input");
    }

    // Element fragments iterate through their span view
    {
        std::vector<int> values{4, 5, 6};
        auto frag = lzc::basic_fragment<int>::borrowed(values);
        int sum = 0;
        for (int v : frag) sum += v;
        TEST(sum == 15, "int fragment: range-for over elements");
        TEST(frag.end() - frag.begin() == 3, "int fragment: iterator distance");
        TEST(!frag.anchored_to_root(), "int fragment: plain borrow is not anchored");
    }

    // Zero-length fragments are legal and still queued
    {
        lzc::basic_fragment_queue<char> queue;
        queue.push(lzc::fragment::borrowed(""));
        TEST(queue.fragment_count() == 1, "zero-length: queued");
        TEST(queue.total_pending_length() == 0, "zero-length: contributes nothing");
        TEST(!queue.empty(), "zero-length: queue not empty");
    }

    // push keeps the running total in sync
    {
        lzc::basic_fragment_queue<char> queue;
        TEST(queue.empty(), "push: new queue empty");
        queue.push(lzc::fragment::borrowed("abc"));
        queue.push(lzc::fragment::owned(std::string("defg")));
        queue.push(lzc::fragment::borrowed("hi"));
        TEST(queue.total_pending_length() == 9, "push: total length");
        TEST(queue.fragment_count() == 3, "push: count");
        TEST(queue.front().view() == "abc", "push: front is first pushed");
        TEST(queue[2].view() == "hi", "push: indexed access");
    }

    // materialize_front_until consumes whole fragments and may overshoot
    {
        lzc::basic_fragment_queue<char> queue;
        queue.push(lzc::fragment::borrowed("abc"));
        queue.push(lzc::fragment::borrowed("defg"));
        queue.push(lzc::fragment::borrowed("hi"));

        std::string root = ">";
        auto appended = queue.materialize_front_until(root, 0);
        TEST(appended == 0 && root == ">", "front_until: zero target appends nothing");

        appended = queue.materialize_front_until(root, 4);
        TEST(appended == 7, "front_until: overshoot to fragment boundary");
        TEST(root == ">abcdefg", "front_until: root contents");
        TEST(queue.fragment_count() == 1, "front_until: one fragment left");
        TEST(queue.total_pending_length() == 2, "front_until: total updated");

        appended = queue.materialize_front_until(root, 100);
        TEST(appended == 2 && queue.empty(), "front_until: exhausts queue");
        TEST(queue.total_pending_length() == 0, "front_until: total zero when empty");

        appended = queue.materialize_front_until(root, 5);
        TEST(appended == 0 && root == ">abcdefghi", "front_until: empty queue is a no-op");
    }

    // Leading zero-length fragments are consumed on the way to the target
    {
        lzc::basic_fragment_queue<char> queue;
        queue.push(lzc::fragment::borrowed(""));
        queue.push(lzc::fragment::borrowed(""));
        queue.push(lzc::fragment::borrowed("xy"));
        queue.push(lzc::fragment::borrowed(""));
        std::string root;
        auto appended = queue.materialize_front_until(root, 1);
        TEST(appended == 2 && root == "xy", "empty heads: materialised through first data");
        TEST(queue.fragment_count() == 1, "empty heads: trailing empty fragment pending");

        appended = queue.materialize_all(root);
        TEST(appended == 0 && queue.empty(), "empty heads: materialize_all drains empties");
    }

    // materialize_all drains in order into a vector root
    {
        std::vector<int> a{1, 2};
        std::vector<int> b{3};
        lzc::basic_fragment_queue<int> queue;
        queue.push(lzc::basic_fragment<int>::borrowed(a));
        queue.push(lzc::basic_fragment<int>::owned(std::vector<int>{4, 5, 6}));
        queue.push(lzc::basic_fragment<int>::borrowed(b));

        std::vector<int> root{0};
        auto appended = queue.materialize_all(root);
        TEST(appended == 6, "materialize_all: appended count");
        TEST((root == std::vector<int>{0, 1, 2, 4, 5, 6, 3}), "materialize_all: order");
        TEST(queue.empty() && queue.total_pending_length() == 0, "materialize_all: drained");
    }

    // Borrowed sources may be released once materialised
    {
        lzc::basic_fragment_queue<char> queue;
        std::string root;
        {
            std::string scoped = "short-lived";
            queue.push(lzc::fragment::borrowed(scoped));
            queue.materialize_all(root);
        }
        TEST(root == "short-lived", "borrowed: source released after materialisation");
    }

    // Moving a queue leaves the source empty
    {
        lzc::basic_fragment_queue<char> queue;
        queue.push(lzc::fragment::borrowed("abc"));
        lzc::basic_fragment_queue<char> other(std::move(queue));
        TEST(other.total_pending_length() == 3, "queue move: target total");
        TEST(queue.empty() && queue.total_pending_length() == 0, "queue move: source reset");
    }

    std::cout << "\nAll fragment and queue tests passed!\n";
    return 0;
}
