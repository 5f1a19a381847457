#define LIFEMESH_LOG_TAG "scheduler"
#include "lifemesh/scheduler.hpp"
#include <algorithm>
#include "lifemesh/log.hpp"

namespace lifemesh {

static std::size_t resolve_workers(const RuntimeConfig& config) {
    if (config.workers > 0) return config.workers;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

bool Barrier::begin_commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Pending) return false;
    state_ = State::Committing;
    return true;
}

void Barrier::complete() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Pending && state_ != State::Committing) return;
        state_ = State::Done;
    }
    cv_.notify_all();
}

void Barrier::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Done || state_ == State::Cancelled || state_ == State::Failed) return;
        state_ = State::Failed;
        error_ = error;
    }
    cv_.notify_all();
}

bool Barrier::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (!cv_.wait_until(lock, deadline, [this] { return state_ != State::Pending; })) {
        state_ = State::Cancelled;
        return false;
    }
    cv_.wait(lock, [this] { return state_ != State::Committing; });
    if (state_ == State::Failed) std::rethrow_exception(error_);
    return state_ == State::Done;
}

void Actor::post(std::function<void()> handler) {
    if (scheduler_.halted()) return;
    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mailbox_.push_back(std::move(handler));
        if (!scheduled_) {
            scheduled_ = true;
            wake = true;
        }
    }
    if (wake) scheduler_.schedule(shared_from_this());
}

void Actor::run(std::size_t batch) {
    for (std::size_t i = 0; i < batch; ++i) {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (mailbox_.empty()) {
                scheduled_ = false;
                return;
            }
            handler = std::move(mailbox_.front());
            mailbox_.pop_front();
        }
        if (scheduler_.halted()) continue;
        try {
            handler();
        } catch (const std::exception& e) {
            LIFEMESH_LOGE("%s: %s", name().c_str(), e.what());
            scheduler_.fail(std::current_exception());
        } catch (...) {
            LIFEMESH_LOGE("%s: non-standard exception", name().c_str());
            scheduler_.fail(std::current_exception());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mailbox_.empty()) {
            scheduled_ = false;
            return;
        }
    }
    scheduler_.schedule(shared_from_this());
}

void Actor::drop_pending() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(mailbox_);
        scheduled_ = false;
    }
}

Scheduler::Scheduler(const RuntimeConfig& config) : config_(config) {
    if (config_.mailbox_batch == 0) config_.mailbox_batch = 1;
    const std::size_t n = resolve_workers(config_);
    threads_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { work(); });
    }
    LIFEMESH_LOGI("started %zu workers", n);
}

Scheduler::~Scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) t.join();
    // Pending closures may own other actors; break those links before release.
    for (auto& actor : ready_) actor->drop_pending();
    ready_.clear();
    LIFEMESH_LOGI("stopped");
}

void Scheduler::schedule(std::shared_ptr<Actor> actor) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            actor->drop_pending();
            return;
        }
        ready_.push_back(std::move(actor));
    }
    cv_.notify_one();
}

void Scheduler::fail(std::exception_ptr error) {
    std::vector<std::weak_ptr<Barrier>> barriers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) return;
        failure_ = error;
        halted_.store(true, std::memory_order_release);
        barriers.swap(barriers_);
    }
    LIFEMESH_LOGE("simulation halted");
    for (auto& weak : barriers) {
        if (auto barrier = weak.lock()) barrier->fail(error);
    }
}

void Scheduler::watch(const std::shared_ptr<Barrier>& barrier) {
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            failure = failure_;
        } else {
            barriers_.erase(std::remove_if(barriers_.begin(), barriers_.end(),
                                           [](const std::weak_ptr<Barrier>& w) { return w.expired(); }),
                            barriers_.end());
            barriers_.push_back(barrier);
            return;
        }
    }
    barrier->fail(failure);
}

void Scheduler::rethrow_if_halted() {
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure = failure_;
    }
    if (failure) std::rethrow_exception(failure);
}

void Scheduler::work() {
    for (;;) {
        std::shared_ptr<Actor> actor;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !ready_.empty(); });
            if (stopping_) return;
            actor = std::move(ready_.front());
            ready_.pop_front();
        }
        actor->run(config_.mailbox_batch);
    }
}

}
