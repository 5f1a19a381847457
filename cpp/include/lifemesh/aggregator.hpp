#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "lifemesh/cell_actor.hpp"
#include "lifemesh/scheduler.hpp"

namespace lifemesh {

struct NeighborReport {
    CellHandle cell;
    std::uint64_t generation;
    unsigned count;
};

class Aggregator : public Actor {
public:
    Aggregator(Scheduler& scheduler,
               std::shared_ptr<const std::vector<CellHandle>> cells,
               std::uint64_t generation,
               std::shared_ptr<Barrier> barrier);

    void tell(NeighborReport report);

    std::string name() const override;

private:
    void handle(const NeighborReport& report);
    void commit();

    std::shared_ptr<const std::vector<CellHandle>> cells_;
    const std::uint64_t generation_;
    std::shared_ptr<Barrier> barrier_;
    std::vector<int> counts_;  // -1 until reported
    std::size_t received_ = 0;
};

// Starts one step from `generation`: an aggregator plus one neighbor counter
// per cell. The returned barrier completes once every cell has been sent its
// update.
std::shared_ptr<Barrier> spawn_step(Scheduler& scheduler,
                                    const std::shared_ptr<const std::vector<CellHandle>>& cells,
                                    std::size_t width, std::size_t height,
                                    std::uint64_t generation);
}
