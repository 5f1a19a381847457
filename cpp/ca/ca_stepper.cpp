#include "lifemesh/ca_stepper.hpp"
#include <vector>
#include <string>
#include "lifemesh/coords.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/rules.hpp"
#ifdef _OPENMP
#include <omp.h>
#endif

namespace lifemesh {

static unsigned live_neighbors(const std::vector<std::uint8_t>& state, std::size_t offset,
                               std::size_t width, std::size_t height) {
    unsigned count = 0;
    for (std::size_t n : neighbor_offsets(offset, width, height)) {
        if (state[n]) ++count;
    }
    return count;
}

std::vector<std::uint8_t> reference_step(const std::vector<std::uint8_t>& state, std::size_t width, std::size_t height) {
    if (width == 0 || height == 0) {
        throw InvalidDimensions(static_cast<long long>(width), static_cast<long long>(height));
    }
    if (state.size() != width * height) {
        throw InvalidDimensions("state has " + std::to_string(state.size()) + " cells, expected " +
                                std::to_string(width * height));
    }
    std::vector<std::uint8_t> out(state.size(), 0);

    #pragma omp parallel for collapse(2) if(width * height > 1024)
    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            const std::size_t k = y * width + x;
            out[k] = rule(state[k] != 0, live_neighbors(state, k, width, height)) ? 1 : 0;
        }
    }
    return out;
}

}
