#include "lifemesh/coords.hpp"

namespace lifemesh {

static const int kDx[kNeighborhoodSize] = {-1, 0, 1, -1, 1, -1, 0, 1};
static const int kDy[kNeighborhoodSize] = {-1, -1, -1, 0, 0, 1, 1, 1};

GridPoint to_xy(std::size_t offset, std::size_t width) {
    return GridPoint{offset % width, offset / width};
}

std::size_t wrap(long long value, std::size_t dimension) {
    const long long d = static_cast<long long>(dimension);
    long long r = value % d;
    if (r < 0) r += d;
    return static_cast<std::size_t>(r);
}

std::size_t to_offset(long long x, long long y, std::size_t width, std::size_t height) {
    return wrap(x, width) + wrap(y, height) * width;
}

std::array<std::size_t, kNeighborhoodSize> neighbor_offsets(std::size_t offset, std::size_t width, std::size_t height) {
    const GridPoint p = to_xy(offset, width);
    std::array<std::size_t, kNeighborhoodSize> out{};
    for (std::size_t i = 0; i < kNeighborhoodSize; ++i) {
        out[i] = to_offset(static_cast<long long>(p.x) + kDx[i],
                           static_cast<long long>(p.y) + kDy[i],
                           width, height);
    }
    return out;
}

}
