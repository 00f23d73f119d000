#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include "../src/ChunkPlanner.hpp"
#include "../src/ChunkerErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static std::vector<ByteRange> plan(const std::string& s, size_t count, std::optional<char> delimiter) {
    return plan_chunks(s.data(), s.size(), count, delimiter);
}

static bool same(const std::vector<ByteRange>& got, const std::vector<ByteRange>& want) {
    if (got != want) {
        std::cerr << "got:";
        for (const auto& r : got) std::cerr << " [" << r.offset << "," << r.end() << ")";
        std::cerr << std::endl;
        return false;
    }
    return true;
}

int main() {
    try {
        // 1) No delimiter after the naive split: one chunk takes the rest, the next is empty
        std::string s1 = "aaaa\nbbbbb";
        ASSERT_TRUE(same(plan(s1, 2, '\n'), {{0, 10}, {10, 0}}));

        // 2) Boundaries move to just after the next newline
        std::string s2 = "ab\ncd\nef\ngh\n";
        ASSERT_TRUE(same(plan(s2, 3, '\n'), {{0, 6}, {6, 3}, {9, 3}}));

        // 3) Empty file: always a single empty range
        ASSERT_TRUE(same(plan("", 1, std::nullopt), {{0, 0}}));
        ASSERT_TRUE(same(plan("", 4, std::nullopt), {{0, 0}}));
        ASSERT_TRUE(same(plan("", 4, '\n'), {{0, 0}}));

        // 4) More chunks than bytes: capped to one byte per chunk
        ASSERT_TRUE(same(plan("abcde", 10, std::nullopt), {{0, 1}, {1, 1}, {2, 1}, {3, 1}, {4, 1}}));

        // 5) Exact equal split
        std::string s5(100, 'z');
        ASSERT_TRUE(same(plan(s5, 4, std::nullopt), {{0, 25}, {25, 25}, {50, 25}, {75, 25}}));

        // A scan that runs past the following naive split carries forward
        std::string carry = "aaaaaaaaaaaaaa\nb\nc\n";
        ASSERT_TRUE(same(plan(carry, 4, '\n'), {{0, 15}, {15, 2}, {17, 2}, {19, 0}}));

        // target == 1 ignores the delimiter
        ASSERT_TRUE(same(plan("a\nbb\nccc", 1, '\n'), {{0, 8}}));

        // Delimiter is the last byte
        ASSERT_TRUE(same(plan("abc\n", 2, '\n'), {{0, 4}, {4, 0}}));

        // Delimiter absent: everything after the first boundary is empty at end of file
        auto absent = plan("0123456789", 10, '\n');
        ASSERT_TRUE(absent.size() == 10);
        ASSERT_TRUE(absent[0] == (ByteRange{0, 10}));
        for (size_t i = 1; i < absent.size(); ++i) {
            ASSERT_TRUE(absent[i] == (ByteRange{10, 0}));
        }

        // Leading and trailing delimiters, delimiter-only content
        ASSERT_TRUE(same(plan("01\n23\n45\n67\n89", 2, '\n'), {{0, 9}, {9, 5}}));
        ASSERT_TRUE(same(plan("\n01\n23\n45\n67\n89\n", 2, '\n'), {{0, 10}, {10, 6}}));
        ASSERT_TRUE(same(plan(std::string(10, '\n'), 2, '\n'), {{0, 6}, {6, 4}}));

        // Any byte value can be the delimiter, including NUL
        std::string nul("ab\0cd\0ef", 8);
        ASSERT_TRUE(same(plan(nul, 2, '\0'), {{0, 6}, {6, 2}}));
        std::string high = "aa\xff" "bb\xff" "cc";
        ASSERT_TRUE(same(plan(high, 3, '\xff'), {{0, 6}, {6, 2}, {8, 0}}));

        // Naive boundaries round half up and do not overflow
        ASSERT_TRUE(naive_boundary(10, 3, 1) == 3);
        ASSERT_TRUE(naive_boundary(10, 3, 2) == 7);
        ASSERT_TRUE(naive_boundary(7, 2, 1) == 4);
        ASSERT_TRUE(naive_boundary(100, 4, 3) == 75);
        ASSERT_TRUE(naive_boundary(SIZE_MAX, 2, 1) == SIZE_MAX / 2 + 1);
        ASSERT_TRUE(naive_boundary(SIZE_MAX, SIZE_MAX, SIZE_MAX - 1) == SIZE_MAX - 1);

        // Size-based planning
        ASSERT_TRUE(same(plan_chunks_by_size(s2.data(), s2.size(), 4, '\n'), {{0, 6}, {6, 3}, {9, 3}}));
        ASSERT_TRUE(same(plan_chunks_by_size(s2.data(), s2.size(), 5, '\n'), {{0, 6}, {6, 6}, {12, 0}}));
        ASSERT_TRUE(same(plan_chunks_by_size(s5.data(), s5.size(), 30, std::nullopt), {{0, 30}, {30, 30}, {60, 30}, {90, 10}}));
        ASSERT_TRUE(same(plan_chunks_by_size(s5.data(), s5.size(), 1000, std::nullopt), {{0, 100}}));
        ASSERT_TRUE(same(plan_chunks_by_size("", 0, 8, '\n'), {{0, 0}}));

        // Requests dispatch on mode
        ASSERT_TRUE(plan_chunks(s2.data(), s2.size(), ChunkRequest::byCount(3, '\n')) == plan(s2, 3, '\n'));
        ASSERT_TRUE(plan_chunks(s5.data(), s5.size(), ChunkRequest::bySize(25)) == plan(s5, 4, std::nullopt));

        // Same input, same output
        ASSERT_TRUE(plan(carry, 3, '\n') == plan(carry, 3, '\n'));

        // Invalid requests
        bool threw = false;
        try { plan(s2, 0, '\n'); } catch (const InvalidRequest&) { threw = true; }
        ASSERT_TRUE(threw);
        threw = false;
        try { plan("", 0, std::nullopt); } catch (const InvalidRequest&) { threw = true; }
        ASSERT_TRUE(threw);
        threw = false;
        try { plan_chunks_by_size(s2.data(), s2.size(), 0, std::nullopt); } catch (const InvalidRequest&) { threw = true; }
        ASSERT_TRUE(threw);

        // Partition checks
        ASSERT_TRUE(is_valid_partition({{0, 0}}, 0));
        ASSERT_TRUE(is_valid_partition({{0, 6}, {6, 0}, {6, 4}}, 10));
        ASSERT_TRUE(!is_valid_partition({}, 0));
        ASSERT_TRUE(!is_valid_partition({{0, 5}, {6, 4}}, 10));
        ASSERT_TRUE(!is_valid_partition({{0, 6}, {5, 5}}, 10));
        ASSERT_TRUE(!is_valid_partition({{0, 6}}, 10));
        ASSERT_TRUE(!is_valid_partition({{0, SIZE_MAX}}, 10));

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All chunk planner tests passed" << std::endl;
    return 0;
}
