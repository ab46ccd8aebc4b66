#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include <flightlock/core/config/loader.hpp>
#include <flightlock/core/cache/cache_store.hpp>
#include <flightlock/core/catalog/product_catalog.hpp>
#include <flightlock/core/catalog/product_source.hpp>
#include <flightlock/core/coalescer/request_coalescer.hpp>
#include <flightlock/core/lock/file_lease_store.hpp>
#include <flightlock/core/lock/lease_store.hpp>
#include <flightlock/core/lock/lock_service.hpp>
#include <flightlock/core/accounts/account_ledger.hpp>
#include <flightlock/core/utils/thread_pool.hpp>

using namespace FlightLock;

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Stores (order matters for destruction)
    std::unique_ptr<MemoryCacheStore> cacheStore;
    std::unique_ptr<LeaseStore> leaseStore;
    std::unique_ptr<MemoryProductSource> productSource;

    // Primitives
    std::unique_ptr<RequestCoalescer<Product>> coalescer;
    std::unique_ptr<LockService> lockService;

    // Domain
    std::unique_ptr<ProductCatalog> catalog;
    std::unique_ptr<AccountBalances> balances;

    std::unique_ptr<ThreadPool> workers;
};

static std::unique_ptr<LeaseStore> createLeaseStore(const AppConfig::LockConfig& lock) {
    if (lock.backend == "file") {
        return std::make_unique<FileLeaseStore>(lock.lease_dir);
    }
    return std::make_unique<MemoryLeaseStore>();
}

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.cacheStore = std::make_unique<MemoryCacheStore>();
    c.leaseStore = createLeaseStore(config.lock);
    c.productSource = std::make_unique<MemoryProductSource>(
        std::chrono::milliseconds(config.demo.fetch_delay_ms));
    c.productSource->put(Product{1, "Product 1"});

    c.coalescer = std::make_unique<RequestCoalescer<Product>>("ProductCoalescer");
    c.lockService = std::make_unique<LockService>(
        *c.leaseStore, std::chrono::milliseconds(config.lock.lease_ttl_ms));

    ReadThroughOptions options;
    options.ttl = std::chrono::milliseconds(config.cache.default_ttl_ms);
    options.write_back = config.cache.write_back;
    options.coalesce_key_prefix = config.cache.coalesce_key_prefix;
    c.catalog = std::make_unique<ProductCatalog>(*c.cacheStore, *c.coalescer, *c.productSource, options);

    c.balances = std::make_unique<AccountBalances>();
    c.workers = std::make_unique<ThreadPool>(static_cast<size_t>(config.demo.worker_threads));

    spdlog::info("Components initialized (lock backend: {})", config.lock.backend);
    return c;
}

// ============================================================================
// Scenarios
// ============================================================================

// N concurrent reads of one cold product; the source should see one load
static bool runStampede(Components& c, const AppConfig::AppConfiguration& config) {
    const int requests = config.demo.concurrent_requests;
    spdlog::info("=== CACHE STAMPEDE: {} concurrent reads of {} ===", requests, ProductCatalog::keyFor(1));

    std::atomic<int> succeeded{0};
    std::vector<std::future<void>> done;
    done.reserve(static_cast<size_t>(requests));

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < requests; ++i) {
        auto finished = std::make_shared<std::promise<void>>();
        done.push_back(finished->get_future());
        c.workers->submit([&c, &succeeded, finished, i]() {
            try {
                KeyedResult<Product> result = c.catalog->getProduct(1);
                if (result.found()) {
                    succeeded.fetch_add(1, std::memory_order_relaxed);
                    spdlog::debug("Request {} got '{}' (shared={})", i, result.value->name, result.shared);
                } else if (!result.ok()) {
                    spdlog::error("Request {} failed: {}", i, result.error->toString());
                }
                finished->set_value();
            } catch (const std::exception&) {
                finished->set_exception(std::current_exception());
            }
        });
    }
    for (auto& f : done) {
        f.get();
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    auto stats = c.coalescer->metrics();
    spdlog::info("Stampede: {}/{} succeeded in {}ms, source loads={}, executions={}, joins={}",
                 succeeded.load(), requests, elapsed, c.productSource->loadCount(),
                 stats.executions, stats.joins);

    // Warm read: served from the cache when write-back is on
    auto warm = c.catalog->getProduct(1);
    spdlog::info("Warm read: found={} cache hits={} source loads={}",
                 warm.found(), c.catalog->cacheHits(), c.productSource->loadCount());
    return succeeded.load() == requests;
}

// Two ledgers over one lease store stand in for two service processes
static bool runAccountContention(Components& c, const AppConfig::AppConfiguration& config) {
    spdlog::info("=== LOCK CONTENTION: two ledgers depositing to acct:42 ===");

    RetryPolicy retry;
    retry.max_attempts = config.lock.retry.max_attempts;
    retry.initial_backoff = std::chrono::milliseconds(config.lock.retry.initial_backoff_ms);
    retry.max_backoff = std::chrono::milliseconds(config.lock.retry.max_backoff_ms);

    AccountLedger processA(*c.lockService, *c.balances, retry, std::chrono::milliseconds(20));
    AccountLedger processB(*c.lockService, *c.balances, retry, std::chrono::milliseconds(20));

    const int deposits = config.demo.deposits;
    std::atomic<int> failures{0};
    auto depositor = [&failures, deposits](AccountLedger& ledger) {
        for (int i = 0; i < deposits; ++i) {
            if (auto err = ledger.depositWithRetry("acct:42", 100)) {
                spdlog::error("Deposit failed: {}", err->toString());
                failures.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    std::thread a(depositor, std::ref(processA));
    std::thread b(depositor, std::ref(processB));
    a.join();
    b.join();

    const int64_t expected = static_cast<int64_t>(deposits) * 2 * 100;
    const int64_t balance = processA.balance("acct:42");
    auto stats = c.lockService->metrics();
    spdlog::info("Balance acct:42 = {} (expected {}), acquired={}, contended={}, released={}",
                 balance, expected, stats.acquired, stats.contended, stats.released);
    return failures.load() == 0 && balance == expected;
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");
    if (c.workers) c.workers->shutdown();
    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    try {
        auto config = loadConfiguration(argc, argv);
        setupLogging(config.logging);
        spdlog::info("{} v{} starting...", config.app_name, config.version);

        auto components = initializeComponents(config);

        bool ok = runStampede(components, config);
        ok = runAccountContention(components, config) && ok;

        stopComponents(components);

        if (!ok) {
            spdlog::error("One or more scenarios did not meet expectations");
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("FlightLock demo terminated gracefully");
    return EXIT_SUCCESS;
}
