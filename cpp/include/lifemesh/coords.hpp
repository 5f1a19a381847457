#pragma once
#include <array>
#include <cstddef>

namespace lifemesh {

constexpr std::size_t kNeighborhoodSize = 8;

struct GridPoint {
    std::size_t x;
    std::size_t y;
};

GridPoint to_xy(std::size_t offset, std::size_t width);

// Wraps any signed coordinate into [0, dimension).
std::size_t wrap(long long value, std::size_t dimension);

std::size_t to_offset(long long x, long long y, std::size_t width, std::size_t height);

// Moore neighborhood in row order: (-1,-1) (0,-1) (1,-1) (-1,0) (1,0) (-1,1) (0,1) (1,1).
// On boards narrower than 3 a cell may appear as its own neighbor.
std::array<std::size_t, kNeighborhoodSize> neighbor_offsets(std::size_t offset, std::size_t width, std::size_t height);
}
