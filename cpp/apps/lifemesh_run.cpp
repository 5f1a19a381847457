#define LIFEMESH_LOG_TAG "run"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <random>
#include <thread>
#include "lifemesh/board.hpp"
#include "lifemesh/config.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/log.hpp"
#include "lifemesh/render.hpp"

using namespace lifemesh;

static void usage(const char* prog) {
    std::fprintf(stderr, "usage: %s [width] [height] [generations] [delay_ms] [seed]\n"
                 "  width, height: 1..%d; seed: 0..%u (0 picks a random seed)\n",
                 prog, std::numeric_limits<int>::max(), std::numeric_limits<std::uint32_t>::max());
}

int main(int argc, char** argv) {
    SimulationConfig config;
    if (!parse_arguments(argc, argv, config)) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::mt19937 rng(config.seed == 0 ? std::random_device{}() : static_cast<std::uint32_t>(config.seed));
    try {
        Board board = Board::generate(config.width, config.height, rng, config.runtime);
        int timeouts = 0;
        for (;;) {
            print_board(std::cout, board);
            if (config.generations != 0 && board.generation() >= config.generations) break;
            try {
                board = board.step();
                timeouts = 0;
            } catch (const StepTimeout& e) {
                LIFEMESH_LOGW("%s, retrying", e.what());
                if (++timeouts >= 2) throw;
            }
            if (config.delay.count() > 0) std::this_thread::sleep_for(config.delay);
        }
    } catch (const ProtocolViolation& e) {
        std::fprintf(stderr, "fatal: %s (actor %s, message: %s)\n", e.what(), e.actor().c_str(), e.message().c_str());
        return EXIT_FAILURE;
    } catch (const InvalidDimensions& e) {
        std::fprintf(stderr, "%s\n", e.what());
        usage(argv[0]);
        return EXIT_FAILURE;
    } catch (const Error& e) {
        std::fprintf(stderr, "fatal: %s\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
