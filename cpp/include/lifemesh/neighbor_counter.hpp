#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "lifemesh/aggregator.hpp"
#include "lifemesh/cell_actor.hpp"
#include "lifemesh/scheduler.hpp"

namespace lifemesh {

class NeighborCounter : public Actor {
public:
    NeighborCounter(Scheduler& scheduler, CellHandle cell, std::uint64_t generation,
                    std::shared_ptr<Aggregator> aggregator);

    void start(const std::vector<CellHandle>& cells, std::size_t width, std::size_t height);

    void tell(CellSnapshot reply);

    std::string name() const override;

private:
    void handle(const CellSnapshot& reply);

    CellHandle cell_;
    const std::uint64_t generation_;
    std::shared_ptr<Aggregator> aggregator_;
    unsigned replies_ = 0;
    unsigned alive_ = 0;
};
}
