#include <cassert>
#include <iostream>
#include <vector>
#include "lifemesh/ca_stepper.hpp"
#include "lifemesh/errors.hpp"

using namespace lifemesh;

static std::vector<std::uint8_t> grid(std::size_t width, std::size_t height,
                                      const std::vector<std::pair<int, int>>& on) {
    std::vector<std::uint8_t> g(width * height, 0);
    for (const auto& p : on) g[p.second * width + p.first] = 1;
    return g;
}

void test_blinker_period_two() {
    const auto horizontal = grid(5, 5, {{1, 2}, {2, 2}, {3, 2}});
    const auto vertical = grid(5, 5, {{2, 1}, {2, 2}, {2, 3}});
    auto next = reference_step(horizontal, 5, 5);
    assert(next == vertical);
    assert(reference_step(next, 5, 5) == horizontal);
    std::cout << "PASSED: test_blinker_period_two\n";
}

// Glider moves one cell right and one down every 4 generations.
//   _*_
//   __*
//   ***
void test_glider_wraps_around() {
    auto g = grid(6, 6, {{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}});
    for (int i = 0; i < 4 * 6; ++i) g = reference_step(g, 6, 6);
    // six full translations bring it back on a 6x6 torus
    assert(g == grid(6, 6, {{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}}));

    auto h = grid(6, 6, {{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}});
    for (int i = 0; i < 4; ++i) h = reference_step(h, 6, 6);
    assert(h == grid(6, 6, {{2, 1}, {3, 2}, {1, 3}, {2, 3}, {3, 3}}));
    std::cout << "PASSED: test_glider_wraps_around\n";
}

void test_large_grid_matches_small_rule() {
    // large enough to take the parallel path
    const std::size_t w = 64, h = 48;
    std::vector<std::uint8_t> g(w * h, 0);
    g[10 * w + 10] = g[10 * w + 11] = g[10 * w + 12] = 1;
    auto next = reference_step(g, w, h);
    std::vector<std::uint8_t> expected(w * h, 0);
    expected[9 * w + 11] = expected[10 * w + 11] = expected[11 * w + 11] = 1;
    assert(next == expected);
    std::cout << "PASSED: test_large_grid_matches_small_rule\n";
}

void test_rejects_bad_shapes() {
    bool thrown = false;
    try {
        reference_step(std::vector<std::uint8_t>(10, 0), 3, 3);
    } catch (const InvalidDimensions&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        reference_step(std::vector<std::uint8_t>(), 0, 4);
    } catch (const InvalidDimensions&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_rejects_bad_shapes\n";
}

int main() {
    test_blinker_period_two();
    test_glider_wraps_around();
    test_large_grid_matches_small_rule();
    test_rejects_bad_shapes();

    std::cout << "\nAll reference stepper tests passed!\n";
    return 0;
}
