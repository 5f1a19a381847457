#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "lifemesh/cell_actor.hpp"
#include "lifemesh/config.hpp"

namespace lifemesh {

namespace detail {
struct Runtime;
}

class Board {
public:
    static Board generate(int width, int height, std::mt19937& rng,
                          const RuntimeConfig& config = RuntimeConfig());
    static Board from_states(int width, int height, const std::vector<std::uint8_t>& alive,
                             const RuntimeConfig& config = RuntimeConfig());

    // Throws StepTimeout, StaleBoard, or the ProtocolViolation that halted the run.
    Board step() const;
    Board step(std::chrono::milliseconds timeout) const;

    std::vector<CellSnapshot> snapshot() const;
    std::vector<CellSnapshot> snapshot(std::chrono::milliseconds timeout) const;
    std::vector<std::uint8_t> states() const;

    std::size_t width() const noexcept { return width_; }
    std::size_t height() const noexcept { return height_; }
    std::uint64_t generation() const noexcept { return generation_; }
    const std::vector<CellHandle>& cells() const noexcept { return *cells_; }

private:
    Board(std::shared_ptr<detail::Runtime> runtime,
          std::shared_ptr<const std::vector<CellHandle>> cells,
          std::size_t width, std::size_t height, std::uint64_t generation);

    // Declared before cells_ so the runtime outlives the handles it schedules.
    std::shared_ptr<detail::Runtime> runtime_;
    std::shared_ptr<const std::vector<CellHandle>> cells_;
    std::size_t width_;
    std::size_t height_;
    std::uint64_t generation_;
};

inline Board step(const Board& board) { return board.step(); }
}
