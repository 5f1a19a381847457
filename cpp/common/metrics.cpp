#include "lifemesh/metrics.hpp"
#include <cmath>

namespace lifemesh {

std::size_t population(const std::vector<std::uint8_t>& states) {
    std::size_t n = 0;
    for (std::uint8_t v : states) {
        if (v) ++n;
    }
    return n;
}

float density(const std::vector<std::uint8_t>& states) {
    if (states.empty()) return 0.0f;
    return static_cast<float>(population(states)) / static_cast<float>(states.size());
}

float entropy(const std::vector<std::uint8_t>& states) {
    const float p_alive = density(states);
    float h = 0.0f;
    for (float p : {p_alive, 1.0f - p_alive}) {
        if (p > 0.0f) h -= p * std::log2(p);
    }
    return h;
}

std::size_t changed_cells(const std::vector<CellSnapshot>& cells, std::uint64_t generation) {
    std::size_t n = 0;
    for (const auto& cell : cells) {
        if (generation > 0 && cell.last_update == generation) ++n;
    }
    return n;
}

}
