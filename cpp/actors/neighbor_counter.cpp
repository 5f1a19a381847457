#include "lifemesh/neighbor_counter.hpp"
#include "lifemesh/coords.hpp"
#include "lifemesh/errors.hpp"

namespace lifemesh {

NeighborCounter::NeighborCounter(Scheduler& scheduler, CellHandle cell, std::uint64_t generation,
                                 std::shared_ptr<Aggregator> aggregator)
    : Actor(scheduler), cell_(std::move(cell)), generation_(generation), aggregator_(std::move(aggregator)) {}

std::string NeighborCounter::name() const {
    return "neighbor-counter#" + std::to_string(cell_.offset()) + "@" + std::to_string(generation_);
}

void NeighborCounter::start(const std::vector<CellHandle>& cells, std::size_t width, std::size_t height) {
    auto self = std::static_pointer_cast<NeighborCounter>(shared_from_this());
    for (std::size_t offset : neighbor_offsets(cell_.offset(), width, height)) {
        cells[offset].query([self](const CellSnapshot& reply) { self->tell(reply); });
    }
}

void NeighborCounter::tell(CellSnapshot reply) {
    post([this, reply]() { handle(reply); });
}

void NeighborCounter::handle(const CellSnapshot& reply) {
    if (replies_ == kNeighborhoodSize) {
        throw ProtocolViolation(name(), "unexpected reply from cell#" + std::to_string(reply.offset));
    }
    if (reply.generation != generation_) {
        throw ProtocolViolation(name(), "reply from cell#" + std::to_string(reply.offset) +
                                            " at generation " + std::to_string(reply.generation));
    }
    if (reply.alive) ++alive_;
    if (++replies_ == kNeighborhoodSize) {
        aggregator_->tell(NeighborReport{cell_, generation_, alive_});
    }
}

}
