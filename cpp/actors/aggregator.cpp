#define LIFEMESH_LOG_TAG "aggregator"
#include "lifemesh/aggregator.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/log.hpp"
#include "lifemesh/neighbor_counter.hpp"

namespace lifemesh {

Aggregator::Aggregator(Scheduler& scheduler,
                       std::shared_ptr<const std::vector<CellHandle>> cells,
                       std::uint64_t generation,
                       std::shared_ptr<Barrier> barrier)
    : Actor(scheduler),
      cells_(std::move(cells)),
      generation_(generation),
      barrier_(std::move(barrier)),
      counts_(cells_->size(), -1) {}

std::string Aggregator::name() const {
    return "aggregator@" + std::to_string(generation_);
}

void Aggregator::tell(NeighborReport report) {
    post([this, report]() { handle(report); });
}

void Aggregator::handle(const NeighborReport& report) {
    const std::size_t offset = report.cell.offset();
    if (report.generation != generation_) {
        throw ProtocolViolation(name(), "report for cell#" + std::to_string(offset) +
                                            " tagged generation " + std::to_string(report.generation));
    }
    if (offset >= counts_.size() || (*cells_)[offset] != report.cell) {
        throw ProtocolViolation(name(), "report for unknown cell#" + std::to_string(offset));
    }
    if (counts_[offset] >= 0) {
        throw ProtocolViolation(name(), "duplicate report for cell#" + std::to_string(offset));
    }
    counts_[offset] = static_cast<int>(report.count);
    if (++received_ == counts_.size()) commit();
}

void Aggregator::commit() {
    if (!barrier_->begin_commit()) {
        LIFEMESH_LOGW("step from generation %llu was abandoned, not committing",
                      static_cast<unsigned long long>(generation_));
        return;
    }
    const std::uint64_t target = generation_ + 1;
    for (std::size_t i = 0; i < counts_.size(); ++i) {
        (*cells_)[i].apply(target, static_cast<unsigned>(counts_[i]));
    }
    barrier_->complete();
}

std::shared_ptr<Barrier> spawn_step(Scheduler& scheduler,
                                    const std::shared_ptr<const std::vector<CellHandle>>& cells,
                                    std::size_t width, std::size_t height,
                                    std::uint64_t generation) {
    auto barrier = std::make_shared<Barrier>();
    scheduler.watch(barrier);
    auto aggregator = std::make_shared<Aggregator>(scheduler, cells, generation, barrier);
    for (const CellHandle& cell : *cells) {
        auto counter = std::make_shared<NeighborCounter>(scheduler, cell, generation, aggregator);
        counter->start(*cells, width, height);
    }
    return barrier;
}

}
