#include <cassert>
#include <iostream>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "lifemesh/board.hpp"
#include "lifemesh/ca_stepper.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/render.hpp"

using namespace lifemesh;

static RuntimeConfig test_config() {
    RuntimeConfig config;
    config.workers = 4;
    config.step_timeout = std::chrono::milliseconds(10000);
    return config;
}

static std::vector<std::uint8_t> pattern(std::size_t width, std::size_t height,
                                         const std::vector<std::pair<int, int>>& on) {
    std::vector<std::uint8_t> alive(width * height, 0);
    for (const auto& p : on) alive[p.second * width + p.first] = 1;
    return alive;
}

static std::set<std::pair<int, int>> live_cells(const Board& board) {
    std::set<std::pair<int, int>> out;
    const auto states = board.states();
    for (std::size_t i = 0; i < states.size(); ++i) {
        if (states[i]) out.insert({static_cast<int>(i % board.width()), static_cast<int>(i / board.width())});
    }
    return out;
}

void test_invalid_dimensions() {
    std::mt19937 rng(1);
    int failures = 0;
    const int dims[][2] = {{0, 5}, {5, 0}, {-1, 3}, {3, -7}, {0, 0}};
    for (const auto& d : dims) {
        try {
            Board::generate(d[0], d[1], rng, test_config());
        } catch (const InvalidDimensions&) {
            ++failures;
        }
    }
    assert(failures == 5);

    bool thrown = false;
    try {
        Board::from_states(3, 3, std::vector<std::uint8_t>(8, 0), test_config());
    } catch (const InvalidDimensions&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_invalid_dimensions\n";
}

void test_generate() {
    std::mt19937 rng(42);
    Board board = Board::generate(7, 5, rng, test_config());
    assert(board.width() == 7 && board.height() == 5);
    assert(board.generation() == 0);
    assert(board.cells().size() == 35);
    for (std::size_t i = 0; i < board.cells().size(); ++i) assert(board.cells()[i].offset() == i);
    for (const auto& cell : board.snapshot()) {
        assert(cell.generation == 0 && cell.last_update == 0);
    }
    std::cout << "PASSED: test_generate\n";
}

void test_generation_counter() {
    std::mt19937 rng(7);
    Board board = Board::generate(6, 6, rng, test_config());
    for (std::uint64_t expected = 1; expected <= 5; ++expected) {
        board = board.step();
        assert(board.generation() == expected);
    }
    // an empty board still counts generations
    Board empty = Board::from_states(3, 3, std::vector<std::uint8_t>(9, 0), test_config());
    Board next = step(empty);
    assert(empty.generation() == 0);
    assert(next.generation() == 1);
    assert(step(next).generation() == 2);
    std::cout << "PASSED: test_generation_counter\n";
}

// Gen 0:  _____     Gen 1:  _____
//         _____             __*__
//         _***_             __*__
//         _____             __*__
//         _____             _____
void test_blinker() {
    Board board = Board::from_states(5, 5, pattern(5, 5, {{1, 2}, {2, 2}, {3, 2}}), test_config());
    const std::set<std::pair<int, int>> horizontal = {{1, 2}, {2, 2}, {3, 2}};
    const std::set<std::pair<int, int>> vertical = {{2, 1}, {2, 2}, {2, 3}};

    assert(live_cells(board) == horizontal);
    board = board.step();
    assert(live_cells(board) == vertical);
    board = board.step();
    assert(live_cells(board) == horizontal);
    board = board.step();
    assert(live_cells(board) == vertical);
    std::cout << "PASSED: test_blinker\n";
}

void test_block_still_life() {
    const auto block = pattern(4, 4, {{1, 1}, {2, 1}, {1, 2}, {2, 2}});
    Board board = Board::from_states(4, 4, block, test_config());
    for (int i = 0; i < 3; ++i) {
        board = board.step();
        assert(board.states() == block);
    }
    for (const auto& cell : board.snapshot()) {
        assert(cell.generation == 3);
        assert(cell.last_update == 0);
    }
    std::cout << "PASSED: test_block_still_life\n";
}

void test_matches_reference_on_random_boards() {
    std::mt19937 rng(20240607);
    for (int trial = 0; trial < 20; ++trial) {
        Board board = Board::generate(4, 4, rng, test_config());
        const auto initial = board.states();
        Board next = board.step();
        assert(next.states() == reference_step(initial, 4, 4));
    }
    std::cout << "PASSED: test_matches_reference_on_random_boards\n";
}

void test_matches_reference_over_many_generations() {
    std::mt19937 rng(99);
    Board board = Board::generate(23, 17, rng, test_config());
    auto expected = board.states();
    for (int gen = 0; gen < 10; ++gen) {
        board = board.step();
        expected = reference_step(expected, 23, 17);
        assert(board.states() == expected);
    }
    std::cout << "PASSED: test_matches_reference_over_many_generations\n";
}

void test_tiny_boards() {
    // 1x1: the cell is all eight of its own neighbors
    Board lone = Board::from_states(1, 1, {1}, test_config());
    Board lone_next = lone.step();
    assert(lone_next.states() == reference_step({1}, 1, 1));
    assert(lone_next.states()[0] == 0);

    Board pair = Board::from_states(2, 1, {1, 0}, test_config());
    Board pair_next = pair.step();
    assert(pair_next.states() == reference_step({1, 0}, 2, 1));
    Board pair_after = pair_next.step();
    assert(pair_after.generation() == 2);
    std::cout << "PASSED: test_tiny_boards\n";
}

void test_render() {
    Board board = Board::from_states(5, 5, pattern(5, 5, {{1, 2}, {2, 2}, {3, 2}}), test_config());
    const std::vector<std::string> expected = {"_____", "_____", "_***_", "_____", "_____"};
    assert(render(board) == expected);

    std::ostringstream out;
    print_board(out, board.step());
    assert(out.str() == "_____\n__*__\n__*__\n__*__\n_____\nGeneration 1\n\n");
    std::cout << "PASSED: test_render\n";
}

int main() {
    test_invalid_dimensions();
    test_generate();
    test_generation_counter();
    test_blinker();
    test_block_still_life();
    test_matches_reference_on_random_boards();
    test_matches_reference_over_many_generations();
    test_tiny_boards();
    test_render();

    std::cout << "\nAll board tests passed!\n";
    return 0;
}
