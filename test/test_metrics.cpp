#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>
#include "lifemesh/board.hpp"
#include "lifemesh/metrics.hpp"

using namespace lifemesh;

void test_population_and_density() {
    std::vector<std::uint8_t> s = {1, 0, 0, 1, 1, 0, 0, 0};
    assert(population(s) == 3);
    assert(std::fabs(density(s) - 0.375f) < 1e-6f);
    assert(population({}) == 0);
    assert(density({}) == 0.0f);
    std::cout << "PASSED: test_population_and_density\n";
}

void test_entropy() {
    assert(entropy(std::vector<std::uint8_t>(16, 0)) == 0.0f);
    assert(entropy(std::vector<std::uint8_t>(16, 1)) == 0.0f);
    assert(std::fabs(entropy({1, 0, 1, 0}) - 1.0f) < 1e-6f);
    const float quarter = entropy({1, 0, 0, 0});
    assert(quarter > 0.8f && quarter < 0.82f);
    std::cout << "PASSED: test_entropy\n";
}

void test_changed_cells_after_blinker_step() {
    std::vector<std::uint8_t> alive(25, 0);
    alive[2 * 5 + 1] = alive[2 * 5 + 2] = alive[2 * 5 + 3] = 1;
    RuntimeConfig config;
    config.workers = 2;
    Board board = Board::from_states(5, 5, alive, config);
    assert(changed_cells(board.snapshot(), 0) == 0);

    Board next = board.step();
    const auto cells = next.snapshot();
    // two ends die, two cells are born, the center survives
    assert(changed_cells(cells, 1) == 4);
    assert(changed_cells(cells, 2) == 0);
    for (const auto& c : cells) assert(c.last_update <= c.generation);
    std::cout << "PASSED: test_changed_cells_after_blinker_step\n";
}

int main() {
    test_population_and_density();
    test_entropy();
    test_changed_cells_after_blinker_step();

    std::cout << "\nAll metrics tests passed!\n";
    return 0;
}
