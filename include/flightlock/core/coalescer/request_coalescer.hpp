// ============================================================================
// REQUEST COALESCER (single-flight group)
// ============================================================================
// Collapses concurrent execute() calls for the same key into one run of the
// work function; every caller that joined receives that run's result.
//
// Registry:
// - key -> shared_ptr<Call>, guarded by one mutex
// - lookup-or-register is a single critical section
// - deregister + completion broadcast is a single critical section, so a
//   caller arriving after the broadcast always starts a new generation
//
// Exceptions thrown by the work function are captured and rethrown to the
// initiating caller and to every joined waiter.
// ============================================================================

#pragma once

#include <flightlock/core/coalescer/keyed_result.hpp>
#include <flightlock/core/metrics/metrics.hpp>
#include <flightlock/core/utils/thread_pool.hpp>

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>

namespace FlightLock {

template <typename T>
class RequestCoalescer {
public:
    using Result = KeyedResult<T>;
    using WorkFn = std::function<Result()>;

    explicit RequestCoalescer(std::string name = "coalescer")
        : name_(std::move(name)) {}

    RequestCoalescer(const RequestCoalescer&) = delete;
    RequestCoalescer& operator=(const RequestCoalescer&) = delete;

    /**
     * @brief Run @p work for @p key, or join the run already in flight.
     *
     * Blocks until the Call completes. Rethrows whatever the work function
     * threw. An empty key yields INVALID_ARGUMENT without running @p work.
     */
    Result execute(const std::string& key, WorkFn work) {
        if (key.empty()) {
            metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
            return Result::failure(ErrorCode::INVALID_ARGUMENT, "coalescing key must not be empty");
        }

        auto registration = joinOrRegister(key);
        const auto& call = registration.first;
        if (!registration.second) {
            runAndComplete(call, work);
        }
        return call->future.get();
    }

    /**
     * @brief Asynchronous variant: the work runs on @p pool.
     *
     * The returned future may be waited on with a caller-side timeout; giving
     * up on it never cancels the Call for other waiters. The coalescer must
     * outlive every task it submitted.
     */
    std::shared_future<Result> executeAsync(const std::string& key, WorkFn work, ThreadPool& pool) {
        if (key.empty()) {
            metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
            std::promise<Result> rejected;
            rejected.set_value(Result::failure(ErrorCode::INVALID_ARGUMENT,
                                               "coalescing key must not be empty"));
            return rejected.get_future().share();
        }

        auto registration = joinOrRegister(key);
        auto call = registration.first;
        if (registration.second) {
            return call->future;
        }

        try {
            pool.submit([this, call, work = std::move(work)]() {
                runAndComplete(call, work);
            });
        } catch (const std::exception& e) {
            spdlog::error("[{}] Could not schedule key={}: {}", name_, key, e.what());
            finish(call, Result{}, std::current_exception());
        }
        return call->future;
    }

    /**
     * @brief Drop the registered Call for @p key without waiting for it.
     *
     * Waiters that already joined still get its result; the next execute()
     * for @p key starts a new generation.
     * @return true if a Call was registered
     */
    bool forget(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it == calls_.end()) {
            return false;
        }
        calls_.erase(it);
        metrics_.forgets.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[{}] Forgot in-flight call key={}", name_, key);
        return true;
    }

    size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    CoalescerSnapshot metrics() const { return snapshotOf(metrics_); }

    const std::string& name() const { return name_; }

private:
    struct Call {
        explicit Call(std::string k)
            : key(std::move(k)), future(promise.get_future().share()) {}

        std::string key;
        std::promise<Result> promise;
        std::shared_future<Result> future;
        size_t waiters = 0;  // guarded by RequestCoalescer::mutex_
    };

    // Returns the Call for key and whether the caller joined an existing one
    std::pair<std::shared_ptr<Call>, bool> joinOrRegister(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(key);
        if (it != calls_.end()) {
            ++it->second->waiters;
            metrics_.joins.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("[{}] Joined in-flight call key={} (waiters={})",
                          name_, key, it->second->waiters);
            return {it->second, true};
        }

        auto call = std::make_shared<Call>(key);
        calls_.emplace(key, call);
        return {call, false};
    }

    void runAndComplete(const std::shared_ptr<Call>& call, const WorkFn& work) {
        metrics_.executions.fetch_add(1, std::memory_order_relaxed);

        Result result;
        try {
            result = work();
        } catch (...) {
            metrics_.failures.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[{}] Work for key={} threw, propagating to all waiters", name_, call->key);
            finish(call, Result{}, std::current_exception());
            return;
        }

        if (!result.ok()) {
            metrics_.failures.fetch_add(1, std::memory_order_relaxed);
        }
        finish(call, std::move(result), nullptr);
    }

    void finish(const std::shared_ptr<Call>& call, Result result, std::exception_ptr failure) {
        std::lock_guard<std::mutex> lock(mutex_);

        // A forgotten Call must not evict the newer generation registered after it
        auto it = calls_.find(call->key);
        if (it != calls_.end() && it->second == call) {
            calls_.erase(it);
        }

        if (failure) {
            call->promise.set_exception(failure);
            return;
        }
        result.shared = call->waiters > 0;
        call->promise.set_value(std::move(result));
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Call>> calls_;
    CoalescerMetrics metrics_;
};

} // namespace FlightLock
