#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>

namespace lifemesh {

// Whole-grid Life step on a row-major toroidal grid of 0/1 cells, computed
// from a single snapshot. Sequential oracle for the actor engine.
std::vector<std::uint8_t> reference_step(const std::vector<std::uint8_t>& state, std::size_t width, std::size_t height);
}
