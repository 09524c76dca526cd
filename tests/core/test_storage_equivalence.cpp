#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <vector>

#include "sumquery.hpp"

#include "common/test_check.hpp"
#include "common/sequences.hpp"

using namespace sumquery;


// -----------------------------------------------------------------------------
// Every (start, end) pair must agree across the three variants.
// -----------------------------------------------------------------------------
template<class A, class B, class C>
static void check_equivalent(const A& a, const B& b, const C& c) {
    TEST_CHECK(a.size() == b.size());
    TEST_CHECK(a.size() == c.size());
    for (std::size_t start = 0; start < a.size(); ++start) {
        for (std::size_t end = start; end < a.size(); ++end) {
            const auto expected = a.query(start, end);
            TEST_CHECK(b.query(start, end) == expected);
            TEST_CHECK(c.query(start, end) == expected);
        }
    }
}

//
// Test 1: integer scenario.
//
void test_equivalence_u32() {
    const auto& data = test::scenario;
    check_equivalent(make_fixed(data), make_owned(data), make_borrowed(data));
    std::cout << "[OK] test_equivalence_u32" << std::endl;
}

//
// Test 2: floating-point scenario.
//
void test_equivalence_f64() {
    const auto& data = test::scenario_f64;
    check_equivalent(make_fixed(data), make_owned(data), make_borrowed(data));
    std::cout << "[OK] test_equivalence_f64" << std::endl;
}

//
// Test 3: borrowed view over a slice matches an owned copy of that slice.
//
void test_borrowed_subspan() {
    const std::vector<std::int32_t> data = {9, -4, 1, 3, 4, 8, 6, 1, 4, 2, -7};
    const std::span<const std::int32_t> slice = std::span<const std::int32_t>(data).subspan(2, 8);

    auto borrowed = make_borrowed(slice);
    auto owned = make_owned(slice);
    std::array<std::int32_t, 8> copy{};
    std::copy(slice.begin(), slice.end(), copy.begin());
    auto fixed = make_fixed(copy);

    check_equivalent(fixed, owned, borrowed);
    TEST_CHECK_EQ(borrowed.query(3, 6), 19);
    TEST_CHECK(borrowed.source().data() == data.data() + 2);

    std::cout << "[OK] test_borrowed_subspan" << std::endl;
}

//
// Test 4: C arrays go through the same entry points.
//
void test_c_array_sources() {
    const int raw[] = {1, 3, 4, 8, 6, 1, 4, 2};
    check_equivalent(make_fixed(raw), make_owned(raw), make_borrowed(raw));
    std::cout << "[OK] test_c_array_sources" << std::endl;
}


int main() {
    test_equivalence_u32();
    test_equivalence_f64();
    test_borrowed_subspan();
    test_c_array_sources();

    std::cout << "\n[TEST] ALL STORAGE EQUIVALENCE TESTS PASSED!" << std::endl;
    return 0;
}
