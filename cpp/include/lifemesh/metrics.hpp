#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include "lifemesh/cell_actor.hpp"

namespace lifemesh {

std::size_t population(const std::vector<std::uint8_t>& states);
float density(const std::vector<std::uint8_t>& states);

float entropy(const std::vector<std::uint8_t>& states);

std::size_t changed_cells(const std::vector<CellSnapshot>& cells, std::uint64_t generation);
}
