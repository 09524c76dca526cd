#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "sumquery.hpp"

#include "common/test_check.hpp"
#include "common/sequences.hpp"

using namespace sumquery;


//
// Test 1: fixed decompose hands back both arrays.
//
void test_decompose_fixed() {
    auto [source, table] = make_fixed(test::scenario).decompose();
    TEST_CHECK(source == test::scenario);
    TEST_CHECK(table == test::scenario_table);
    std::cout << "[OK] test_decompose_fixed" << std::endl;
}

//
// Test 2: owned decompose moves the vectors out without copying.
//
void test_decompose_owned() {
    std::vector<std::uint32_t> data(test::scenario.begin(), test::scenario.end());
    const auto* buffer = data.data();

    auto idx = make_owned(std::move(data));
    auto [source, table] = std::move(idx).decompose();

    TEST_CHECK(source.data() == buffer);
    TEST_CHECK(std::ranges::equal(source, test::scenario));
    TEST_CHECK(std::ranges::equal(table, test::scenario_table));
    std::cout << "[OK] test_decompose_owned" << std::endl;
}

//
// Test 3: borrowed decompose returns the caller's view and the table.
//
void test_decompose_borrowed() {
    const std::vector<std::uint32_t> data(test::scenario.begin(), test::scenario.end());
    auto [view, table] = make_borrowed(data).decompose();

    TEST_CHECK(view.data() == data.data());
    TEST_CHECK(view.size() == data.size());
    TEST_CHECK(std::ranges::equal(table, test::scenario_table));
    std::cout << "[OK] test_decompose_borrowed" << std::endl;
}

//
// Test 3b: a decomposed borrowed index is left empty, view included.
//
void test_decompose_borrowed_leaves_empty() {
    const std::vector<std::uint32_t> data(test::scenario.begin(), test::scenario.end());
    auto idx = make_borrowed(data);
    auto [view, table] = std::move(idx).decompose();

    TEST_CHECK(view.size() == data.size());
    TEST_CHECK(table.size() == data.size());
    TEST_CHECK(idx.size() == 0);
    TEST_CHECK(idx.source().empty());
    TEST_CHECK(idx.empty());
    TEST_CHECK(!idx.contains(0, 0));
    std::cout << "[OK] test_decompose_borrowed_leaves_empty" << std::endl;
}

//
// Test 4: memory accounting per variant.
//
void test_memory_usage() {
    auto fixed = make_fixed(test::scenario);
    const auto fixed_fp = fixed.memory_usage();
    TEST_CHECK(fixed_fp.dynamic_bytes == 0);
    TEST_CHECK(fixed_fp.static_bytes == sizeof(storage::Fixed<std::uint32_t, 8>));

    auto owned = make_owned(test::scenario);
    const auto owned_fp = owned.memory_usage();
    // Source and table both live on the heap
    TEST_CHECK(owned_fp.dynamic_bytes >= 2 * 8 * sizeof(std::uint32_t));

    auto borrowed = make_borrowed(test::scenario);
    const auto borrowed_fp = borrowed.memory_usage();
    // Only the table is owned
    TEST_CHECK(borrowed_fp.dynamic_bytes >= 8 * sizeof(std::uint32_t));
    TEST_CHECK(borrowed_fp.dynamic_bytes < owned_fp.dynamic_bytes);
    TEST_CHECK(borrowed_fp.total_bytes() == borrowed_fp.static_bytes + borrowed_fp.dynamic_bytes);

    std::cout << "[OK] test_memory_usage" << std::endl;
}

//
// Test 5: equality and ordering compare elements, not storage identity.
//
void test_comparison() {
    const std::vector<int> a = {1, 2, 3};
    const std::vector<int> a_copy = {1, 2, 3};
    const std::vector<int> b = {1, 2, 4};

    TEST_CHECK(make_borrowed(a) == make_borrowed(a_copy));
    TEST_CHECK(make_borrowed(a) != make_borrowed(b));
    TEST_CHECK(make_borrowed(a) < make_borrowed(b));

    TEST_CHECK(make_owned(a) == make_owned(a_copy));
    TEST_CHECK(make_owned(b) > make_owned(a));

    TEST_CHECK(make_fixed({1, 2, 3}) == make_fixed({1, 2, 3}));
    TEST_CHECK(make_fixed({1, 2, 3}) < make_fixed({1, 3, 0}));

    // Shorter prefix orders first
    TEST_CHECK(make_owned(std::vector<int>{1, 2}) < make_owned(a));

    std::cout << "[OK] test_comparison" << std::endl;
}

//
// Test 6: copies are independent values with identical answers.
//
void test_copy_semantics() {
    auto original = make_owned(test::scenario);
    auto copy = original;
    TEST_CHECK(copy == original);
    TEST_CHECK(copy.table().data() != original.table().data());
    for (const auto& q : test::scenario_queries) {
        TEST_CHECK_EQ(copy.query(q.start, q.end), q.sum);
    }
    std::cout << "[OK] test_copy_semantics" << std::endl;
}

//
// Test 7: streaming prints source then table.
//
void test_stream_output() {
    std::ostringstream os;
    os << make_fixed({1, 3, 4});
    TEST_CHECK_EQ(os.str(), std::string("PrefixSumIndex{source: [1, 3, 4], table: [1, 4, 8]}"));

    std::ostringstream empty_os;
    empty_os << make_owned(std::vector<double>{});
    TEST_CHECK_EQ(empty_os.str(), std::string("PrefixSumIndex{source: [], table: []}"));

    const std::vector<double> data = {1.5, 2.5};
    std::ostringstream borrowed_os;
    borrowed_os << make_borrowed(data);
    TEST_CHECK_EQ(borrowed_os.str(), std::string("PrefixSumIndex{source: [1.5, 2.5], table: [1.5, 4]}"));

    std::cout << "[OK] test_stream_output" << std::endl;
}


int main() {
    test_decompose_fixed();
    test_decompose_owned();
    test_decompose_borrowed();
    test_decompose_borrowed_leaves_empty();
    test_memory_usage();
    test_comparison();
    test_copy_semantics();
    test_stream_output();

    std::cout << "\n[TEST] ALL DECOMPOSE TESTS PASSED!" << std::endl;
    return 0;
}
