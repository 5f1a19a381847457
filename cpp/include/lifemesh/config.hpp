#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lifemesh {

struct RuntimeConfig {
    std::size_t workers = 0;  // 0: one per hardware thread
    std::chrono::milliseconds step_timeout{10000};
    std::size_t mailbox_batch = 64;
};

struct SimulationConfig {
    int width = 10;
    int height = 10;
    std::uint64_t seed = 0;  // 0: seed from std::random_device
    std::uint64_t generations = 0;  // 0: run until interrupted
    std::chrono::milliseconds delay{0};
    RuntimeConfig runtime;
};

// Positional [width] [height] [generations] [delay_ms] [seed]. Leaves `config`
// untouched and returns false on a malformed or out of range argument.
bool parse_arguments(int argc, const char* const* argv, SimulationConfig& config);
}
