#define LIFEMESH_LOG_TAG "cell"
#include "lifemesh/cell_actor.hpp"
#include "lifemesh/coords.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/log.hpp"
#include "lifemesh/rules.hpp"

namespace lifemesh {

CellActor::CellActor(Scheduler& scheduler, std::size_t offset, bool alive)
    : Actor(scheduler), offset_(offset), alive_(alive) {}

std::string CellActor::name() const {
    return "cell#" + std::to_string(offset_);
}

void CellActor::tell(QueryState message) {
    post([this, message]() { handle(message); });
}

void CellActor::tell(ApplyNeighborCount message) {
    post([this, message]() { handle(message); });
}

void CellActor::handle(const QueryState& message) {
    message.reply_to(CellSnapshot{offset_, generation_, last_update_, alive_});
}

void CellActor::handle(const ApplyNeighborCount& message) {
    if (message.count > kNeighborhoodSize) {
        throw ProtocolViolation(name(), "ApplyNeighborCount with count " + std::to_string(message.count));
    }
    if (message.generation <= generation_) {
        LIFEMESH_LOGD("%s ignored generation %llu, already at %llu", name().c_str(),
                      static_cast<unsigned long long>(message.generation),
                      static_cast<unsigned long long>(generation_));
        return;
    }
    const bool next = rule(alive_, message.count);
    if (next != alive_) last_update_ = message.generation;
    generation_ = message.generation;
    alive_ = next;
}

void CellHandle::query(ReplyTo reply_to) const {
    actor_->tell(QueryState{std::move(reply_to)});
}

void CellHandle::apply(std::uint64_t generation, unsigned count) const {
    actor_->tell(ApplyNeighborCount{generation, count});
}

}
