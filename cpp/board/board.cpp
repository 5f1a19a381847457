#define LIFEMESH_LOG_TAG "board"
#include "lifemesh/board.hpp"
#include <mutex>
#include "lifemesh/aggregator.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/log.hpp"
#include "lifemesh/scheduler.hpp"

namespace lifemesh {

namespace detail {
struct Runtime {
    explicit Runtime(const RuntimeConfig& config) : scheduler(config) {}

    Scheduler scheduler;
    std::mutex step_mutex;
    std::uint64_t generation = 0;  // last committed, guarded by step_mutex
};
}

Board::Board(std::shared_ptr<detail::Runtime> runtime,
             std::shared_ptr<const std::vector<CellHandle>> cells,
             std::size_t width, std::size_t height, std::uint64_t generation)
    : runtime_(std::move(runtime)), cells_(std::move(cells)), width_(width), height_(height), generation_(generation) {}

Board Board::generate(int width, int height, std::mt19937& rng, const RuntimeConfig& config) {
    if (width <= 0 || height <= 0) throw InvalidDimensions(width, height);
    std::bernoulli_distribution coin(0.5);
    std::vector<std::uint8_t> alive(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (auto& cell : alive) cell = coin(rng) ? 1 : 0;
    return from_states(width, height, alive, config);
}

Board Board::from_states(int width, int height, const std::vector<std::uint8_t>& alive,
                         const RuntimeConfig& config) {
    if (width <= 0 || height <= 0) throw InvalidDimensions(width, height);
    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    if (alive.size() != w * h) {
        throw InvalidDimensions("state vector has " + std::to_string(alive.size()) + " cells, expected " +
                                std::to_string(w * h));
    }

    auto runtime = std::make_shared<detail::Runtime>(config);
    auto cells = std::make_shared<std::vector<CellHandle>>();
    cells->reserve(alive.size());
    for (std::size_t i = 0; i < alive.size(); ++i) {
        cells->emplace_back(std::make_shared<CellActor>(runtime->scheduler, i, alive[i] != 0), i);
    }
    LIFEMESH_LOGI("created %zux%zu board", w, h);
    return Board(runtime, cells, w, h, 0);
}

Board Board::step() const {
    return step(runtime_->scheduler.config().step_timeout);
}

Board Board::step(std::chrono::milliseconds timeout) const {
    std::lock_guard<std::mutex> lock(runtime_->step_mutex);
    Scheduler& scheduler = runtime_->scheduler;
    scheduler.rethrow_if_halted();
    if (generation_ != runtime_->generation) throw StaleBoard(generation_, runtime_->generation);

    auto barrier = spawn_step(scheduler, cells_, width_, height_, generation_);
    if (!barrier->wait(timeout)) {
        LIFEMESH_LOGW("step from generation %llu timed out after %lld ms",
                      static_cast<unsigned long long>(generation_), static_cast<long long>(timeout.count()));
        throw StepTimeout(generation_, timeout);
    }
    runtime_->generation = generation_ + 1;
    LIFEMESH_LOGD("advanced to generation %llu", static_cast<unsigned long long>(generation_ + 1));
    return Board(runtime_, cells_, width_, height_, generation_ + 1);
}

namespace {
struct SnapshotSink {
    std::mutex mutex;
    std::vector<CellSnapshot> cells;
    std::size_t remaining;
};
}

std::vector<CellSnapshot> Board::snapshot() const {
    return snapshot(runtime_->scheduler.config().step_timeout);
}

std::vector<CellSnapshot> Board::snapshot(std::chrono::milliseconds timeout) const {
    Scheduler& scheduler = runtime_->scheduler;
    scheduler.rethrow_if_halted();

    auto barrier = std::make_shared<Barrier>();
    scheduler.watch(barrier);
    auto sink = std::make_shared<SnapshotSink>();
    sink->cells.resize(cells_->size());
    sink->remaining = cells_->size();

    for (const CellHandle& cell : *cells_) {
        cell.query([sink, barrier](const CellSnapshot& reply) {
            bool done;
            {
                std::lock_guard<std::mutex> lock(sink->mutex);
                sink->cells[reply.offset] = reply;
                done = --sink->remaining == 0;
            }
            if (done) barrier->complete();
        });
    }

    if (!barrier->wait(timeout)) {
        throw Timeout("snapshot of generation " + std::to_string(generation_) + " did not finish within " +
                      std::to_string(timeout.count()) + " ms");
    }
    std::lock_guard<std::mutex> lock(sink->mutex);
    return sink->cells;
}

std::vector<std::uint8_t> Board::states() const {
    const std::vector<CellSnapshot> cells = snapshot();
    std::vector<std::uint8_t> out(cells.size());
    for (std::size_t i = 0; i < cells.size(); ++i) out[i] = cells[i].alive ? 1 : 0;
    return out;
}

}
