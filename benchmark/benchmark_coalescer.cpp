// ============================================================================
// BENCHMARK: COALESCED vs DIRECT UPSTREAM FETCH
// ============================================================================
// Test scenarios:
// 1. Stampede on one hot key (many readers, slow upstream)
// 2. Uncontended fast path (single caller per key)
// 3. Distributed mutex acquire/release throughput
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <iomanip>
#include <string>
#include <flightlock/core/coalescer/request_coalescer.hpp>
#include <flightlock/core/lock/lease_store.hpp>
#include <flightlock/core/lock/lock_service.hpp>

using namespace FlightLock;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t upstream_calls;
    uint64_t elapsed_ns;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    double ms = r.elapsed_ns / 1e6;
    std::cout << std::left << std::setw(28) << r.name
              << std::right
              << std::setw(10) << r.total_ops << " ops | "
              << std::setw(8) << r.upstream_calls << " upstream | "
              << std::setw(10) << std::fixed << std::setprecision(1) << ms << " ms | "
              << std::setw(10) << std::fixed << std::setprecision(0)
              << (r.elapsed_ns / static_cast<double>(r.total_ops)) << " ns/op"
              << std::endl;
}

// Simulated slow upstream
KeyedResult<int> slow_fetch(std::atomic<uint64_t>& calls, std::chrono::microseconds latency) {
    calls.fetch_add(1, std::memory_order_relaxed);
    std::this_thread::sleep_for(latency);
    return KeyedResult<int>::success(42);
}

// ============================================================================
// SCENARIOS
// ============================================================================

BenchmarkResult benchmark_hot_key(bool coalesce, int num_threads, int per_thread,
                                  std::chrono::microseconds latency) {
    RequestCoalescer<int> coalescer("bench");
    std::atomic<uint64_t> calls{0};
    std::vector<std::thread> threads;

    auto start = std::chrono::high_resolution_clock::now();
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < per_thread; ++i) {
                if (coalesce) {
                    coalescer.execute("product:1", [&]() { return slow_fetch(calls, latency); });
                } else {
                    slow_fetch(calls, latency);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    return {coalesce ? "coalesced" : "direct",
            static_cast<uint64_t>(num_threads) * per_thread, calls.load(), elapsed_ns};
}

BenchmarkResult benchmark_uncontended(uint64_t num_ops) {
    RequestCoalescer<int> coalescer("bench");
    std::atomic<uint64_t> calls{0};

    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < num_ops; ++i) {
        coalescer.execute("product:" + std::to_string(i % 1024), [&]() {
            calls.fetch_add(1, std::memory_order_relaxed);
            return KeyedResult<int>::success(static_cast<int>(i));
        });
    }
    auto end = std::chrono::high_resolution_clock::now();

    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    return {"uncontended execute", num_ops, calls.load(), elapsed_ns};
}

BenchmarkResult benchmark_lock_cycle(uint64_t num_ops) {
    MemoryLeaseStore store;
    LockService service(store, std::chrono::milliseconds(8000));

    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < num_ops; ++i) {
        auto m = service.newMutex("add-account:{42}");
        if (!m->lock()) {
            m->unlock();
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    return {"lock/unlock (memory)", num_ops, service.metrics().acquired, elapsed_ns};
}

int main() {
    std::cout << "\n";
    std::cout << "╔════════════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              REQUEST COALESCER BENCHMARK SUITE                     ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════════════╝\n";

    const std::chrono::microseconds latency(2000);

    print_header("Hot key stampede (16 threads x 50 reads, 2ms upstream)");
    print_result(benchmark_hot_key(false, 16, 50, latency));
    print_result(benchmark_hot_key(true, 16, 50, latency));

    print_header("Uncontended fast path");
    print_result(benchmark_uncontended(200000));

    print_header("Distributed mutex");
    print_result(benchmark_lock_cycle(200000));

    std::cout << "\n";
    return 0;
}
