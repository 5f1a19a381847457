#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "lifemesh/config.hpp"

namespace lifemesh {

class Scheduler;

// One-shot rendezvous between a caller waiting with a deadline and the actor
// that finishes the work. A caller that gives up before the actor starts
// committing cancels the work; once committing, the caller waits it out.
class Barrier {
public:
    // False when the waiter already gave up or the simulation failed.
    bool begin_commit();
    void complete();
    void fail(std::exception_ptr error);

    // Returns false on timeout. Rethrows the failure passed to fail().
    bool wait(std::chrono::milliseconds timeout);

private:
    enum class State { Pending, Committing, Done, Cancelled, Failed };

    std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Pending;
    std::exception_ptr error_;
};

// Runs on at most one worker at a time.
class Actor : public std::enable_shared_from_this<Actor> {
public:
    explicit Actor(Scheduler& scheduler) : scheduler_(scheduler) {}
    virtual ~Actor() = default;

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    virtual std::string name() const = 0;

protected:
    void post(std::function<void()> handler);
    Scheduler& scheduler() const { return scheduler_; }

private:
    friend class Scheduler;

    void run(std::size_t batch);
    void drop_pending();

    Scheduler& scheduler_;
    std::mutex mutex_;
    std::deque<std::function<void()>> mailbox_;
    bool scheduled_ = false;
};

class Scheduler {
public:
    explicit Scheduler(const RuntimeConfig& config);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void schedule(std::shared_ptr<Actor> actor);

    void fail(std::exception_ptr error);

    // Fails the barrier if the scheduler halts before it completes.
    void watch(const std::shared_ptr<Barrier>& barrier);

    bool halted() const { return halted_.load(std::memory_order_acquire); }
    void rethrow_if_halted();

    const RuntimeConfig& config() const { return config_; }
    std::size_t workers() const { return threads_.size(); }

private:
    void work();

    RuntimeConfig config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Actor>> ready_;
    std::vector<std::weak_ptr<Barrier>> barriers_;
    std::exception_ptr failure_;
    std::atomic<bool> halted_{false};
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};
}
