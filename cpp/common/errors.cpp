#include "lifemesh/errors.hpp"

namespace lifemesh {

InvalidDimensions::InvalidDimensions(long long width, long long height)
    : Error("board dimensions must be positive, got " + std::to_string(width) + "x" + std::to_string(height)) {}

ProtocolViolation::ProtocolViolation(const std::string& actor, const std::string& message)
    : Error("protocol violation in " + actor + ": " + message), actor_(actor), message_(message) {}

StepTimeout::StepTimeout(std::uint64_t generation, std::chrono::milliseconds waited)
    : Timeout("step from generation " + std::to_string(generation) + " did not finish within " +
              std::to_string(waited.count()) + " ms"),
      generation_(generation) {}

StaleBoard::StaleBoard(std::uint64_t board_generation, std::uint64_t current_generation)
    : Error("board at generation " + std::to_string(board_generation) +
            " is stale, simulation is at generation " + std::to_string(current_generation)) {}

}
