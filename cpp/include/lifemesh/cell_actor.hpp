#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "lifemesh/scheduler.hpp"

namespace lifemesh {

struct CellSnapshot {
    std::size_t offset;
    std::uint64_t generation;
    std::uint64_t last_update;
    bool alive;
};

using ReplyTo = std::function<void(const CellSnapshot&)>;

struct QueryState {
    ReplyTo reply_to;
};

// Commit generation `generation` using `count` live neighbors. Stale or
// duplicate generations are ignored.
struct ApplyNeighborCount {
    std::uint64_t generation;
    unsigned count;
};

class CellActor : public Actor {
public:
    CellActor(Scheduler& scheduler, std::size_t offset, bool alive);

    void tell(QueryState message);
    void tell(ApplyNeighborCount message);

    std::string name() const override;

private:
    void handle(const QueryState& message);
    void handle(const ApplyNeighborCount& message);

    const std::size_t offset_;
    std::uint64_t generation_ = 0;
    std::uint64_t last_update_ = 0;
    bool alive_;
};

// Routing reference to one cell actor. Valid while the scheduler that runs
// the actor is alive.
class CellHandle {
public:
    CellHandle() = default;
    CellHandle(std::shared_ptr<CellActor> actor, std::size_t offset)
        : actor_(std::move(actor)), offset_(offset) {}

    std::size_t offset() const { return offset_; }

    void query(ReplyTo reply_to) const;
    void apply(std::uint64_t generation, unsigned count) const;

    bool operator==(const CellHandle& other) const { return actor_ == other.actor_; }
    bool operator!=(const CellHandle& other) const { return actor_ != other.actor_; }

private:
    std::shared_ptr<CellActor> actor_;
    std::size_t offset_ = 0;
};
}
