#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ResourcePool.hpp"
#include "TestBackends.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace respool;
using namespace respool::test;
using namespace std::chrono_literals;

class ResourcePoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<TestBackend>();

        config_.min_pool_size = 1;
        config_.max_pool_size = 2;
        config_.wait_conn_timeout = 50ms;
        config_.idle_timeout = 1h;
        config_.cleanup_idle_interval = 1h;
        config_.worker_close_timeout = 2s;
        config_.submit_timeout = 2s;
    }

    std::unique_ptr<ResourcePool> makePool() {
        return std::make_unique<ResourcePool>(config_, backend_);
    }

    static PoolError errorOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const PoolException& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected PoolException";
        return PoolError::InvalidConfig;
    }

    // Poll until pred holds or the deadline passes
    static bool eventually(const std::function<bool()>& pred,
                           std::chrono::milliseconds deadline = 2s) {
        auto end = std::chrono::steady_clock::now() + deadline;
        while (std::chrono::steady_clock::now() < end) {
            if (pred()) return true;
            std::this_thread::sleep_for(2ms);
        }
        return pred();
    }

    std::shared_ptr<TestBackend> backend_;
    PoolConfig config_;
};

// Construction

TEST_F(ResourcePoolTest, CreatesMinimumResources) {
    config_.min_pool_size = 2;
    config_.max_pool_size = 4;
    auto pool = makePool();

    EXPECT_EQ(pool->activeCount(), 2u);
    EXPECT_EQ(pool->availableCount(), 2u);
    EXPECT_EQ(pool->totalCount(), 2u);
    EXPECT_EQ(backend_->stats().initialized, 2);
    EXPECT_TRUE(pool->healthCheck());
    EXPECT_FALSE(pool->isShutdown());
}

TEST_F(ResourcePoolTest, NormalizesConfiguration) {
    config_.min_pool_size = 5;
    config_.max_pool_size = 2;
    auto pool = makePool();

    EXPECT_EQ(pool->config().min_pool_size, 2);
    EXPECT_EQ(pool->config().max_pool_size, 2);
    EXPECT_EQ(pool->activeCount(), 2u);
}

TEST_F(ResourcePoolTest, ZeroMinimumStillCreatesOneResource) {
    config_.min_pool_size = 0;
    config_.max_pool_size = 0;
    auto pool = makePool();

    EXPECT_EQ(pool->config().min_pool_size, 1);
    EXPECT_EQ(pool->config().max_pool_size, 1);
    EXPECT_EQ(pool->activeCount(), 1u);
}

TEST_F(ResourcePoolTest, ConstructionFailureTearsDownCreatedResources) {
    config_.min_pool_size = 2;
    config_.max_pool_size = 2;
    backend_->failOnAttempt(2);

    EXPECT_EQ(errorOf([&] { makePool(); }), PoolError::Construction);

    EXPECT_EQ(backend_->stats().initAttempts, 2);
    EXPECT_EQ(backend_->stats().initialized, 1);
    EXPECT_EQ(backend_->stats().released, 1);
}

TEST_F(ResourcePoolTest, RejectsMissingBackend) {
    EXPECT_EQ(errorOf([&] { ResourcePool pool(config_, nullptr); }), PoolError::InvalidConfig);
}

// Command execution

TEST_F(ResourcePoolTest, EchoRoundTrip) {
    auto pool = makePool();
    std::string payload = R"({"id": 7, "name": "widget"})";
    EXPECT_EQ(pool->executeCommand("echo", payload), payload);
}

TEST_F(ResourcePoolTest, NonStringResultsAreFormatted) {
    auto pool = makePool();
    EXPECT_EQ(pool->executeCommand("int", "42"), "42");
    EXPECT_EQ(pool->executeCommand("real", "0.5"), "0.5");
    EXPECT_EQ(pool->executeCommand("flag", "false"), "false");
}

TEST_F(ResourcePoolTest, ExecutionErrorReturnsResourceToService) {
    auto pool = makePool();

    try {
        pool->executeCommand("fail", "table is locked");
        FAIL() << "expected PoolException";
    } catch (const PoolException& e) {
        EXPECT_EQ(e.code(), PoolError::Execution);
        EXPECT_STREQ(e.what(), "table is locked");
    }

    EXPECT_EQ(pool->availableCount(), pool->activeCount());
    EXPECT_EQ(pool->executeCommand("echo", "after"), "after");
}

TEST_F(ResourcePoolTest, ResultShapeErrorReturnsResourceToService) {
    auto pool = makePool();

    EXPECT_EQ(errorOf([&] { pool->executeCommand("nothing", ""); }), PoolError::ResultShape);
    EXPECT_EQ(pool->availableCount(), 1u);
    for (const auto& resource : pool->status().resources) {
        EXPECT_FALSE(resource.busy);
    }
}

TEST_F(ResourcePoolTest, ExecuteRunsFunctionOnLeasedRecord) {
    auto pool = makePool();

    int id = pool->execute([](ResourceRecord& record) {
        EXPECT_TRUE(record.isBusy());
        return record.id();
    });
    EXPECT_EQ(id, pool->status().resources.front().id);
    EXPECT_EQ(pool->availableCount(), 1u);
}

TEST_F(ResourcePoolTest, ExecuteReleasesWhenFunctionThrows) {
    auto pool = makePool();

    EXPECT_THROW(pool->execute([](ResourceRecord&) -> int {
        throw std::runtime_error("caller bug");
    }), std::runtime_error);
    EXPECT_EQ(pool->availableCount(), 1u);
}

// Acquire and release

TEST_F(ResourcePoolTest, AcquireMarksBusyAndReleaseReturnsIt) {
    auto pool = makePool();

    auto record = pool->acquire();
    ASSERT_NE(record, nullptr);
    EXPECT_TRUE(record->isBusy());
    EXPECT_EQ(record->useCount(), 1);
    EXPECT_EQ(pool->availableCount(), 0u);

    pool->release(record);
    EXPECT_FALSE(record->isBusy());
    EXPECT_EQ(pool->availableCount(), 1u);

    auto again = pool->acquire();
    EXPECT_EQ(again->id(), record->id());
    EXPECT_EQ(again->useCount(), 2);
    pool->release(again);
}

TEST_F(ResourcePoolTest, ReleaseTwiceDoesNotDuplicateRecord) {
    auto pool = makePool();

    auto record = pool->acquire();
    pool->release(record);
    pool->release(record);
    EXPECT_EQ(pool->availableCount(), 1u);
    EXPECT_EQ(pool->activeCount(), 1u);

    auto first = pool->acquire();
    auto second = pool->acquire();
    EXPECT_NE(first, second);
    EXPECT_NE(first->id(), second->id());
    EXPECT_TRUE(first->isBusy());
    EXPECT_TRUE(second->isBusy());
    EXPECT_EQ(backend_->stats().initialized, 2);

    pool->release(first);
    pool->release(second);
}

TEST_F(ResourcePoolTest, ConcurrentDoubleReleaseQueuesRecordOnce) {
    auto pool = makePool();

    for (int round = 0; round < 50; ++round) {
        auto record = pool->acquire();
        std::thread other([&] { pool->release(record); });
        pool->release(record);
        other.join();
        ASSERT_EQ(pool->availableCount(), 1u);
        ASSERT_FALSE(record->isBusy());
    }
}

TEST_F(ResourcePoolTest, ReleaseAfterCloseTearsDownResource) {
    auto pool = makePool();
    auto record = pool->acquire();

    pool->close();
    EXPECT_EQ(backend_->stats().released, 1);

    pool->release(record);
    EXPECT_FALSE(record->isBusy());
    EXPECT_EQ(pool->availableCount(), 0u);
    EXPECT_EQ(backend_->stats().released, 1);
}

TEST_F(ResourcePoolTest, LeaseReleasesOnScopeExit) {
    auto pool = makePool();
    {
        ResourceLease lease = pool->lease();
        EXPECT_TRUE(lease.isValid());
        EXPECT_TRUE(lease->isBusy());
        EXPECT_EQ(pool->availableCount(), 0u);

        ResourceLease moved = std::move(lease);
        EXPECT_FALSE(lease.isValid());
        EXPECT_TRUE(moved.isValid());
    }
    EXPECT_EQ(pool->availableCount(), 1u);
}

TEST_F(ResourcePoolTest, GrowsAfterWaitTimeoutUpToMaximum) {
    auto pool = makePool();

    auto first = pool->acquire();

    auto start = std::chrono::steady_clock::now();
    auto second = pool->acquire();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_NE(first->id(), second->id());
    EXPECT_EQ(pool->activeCount(), 2u);

    EXPECT_EQ(errorOf([&] { pool->acquire(); }), PoolError::AcquireTimeout);
    EXPECT_EQ(pool->activeCount(), 2u);

    pool->release(first);
    pool->release(second);
    EXPECT_EQ(pool->availableCount(), 2u);
}

TEST_F(ResourcePoolTest, WaitingAcquirerGetsReleasedResource) {
    config_.max_pool_size = 1;
    config_.wait_conn_timeout = 2s;
    auto pool = makePool();

    auto held = pool->acquire();
    auto waiter = std::async(std::launch::async, [&] { return pool->acquire(); });

    std::this_thread::sleep_for(30ms);
    pool->release(held);

    auto record = waiter.get();
    EXPECT_EQ(record->id(), held->id());
    EXPECT_EQ(pool->activeCount(), 1u);
    pool->release(record);
}

TEST_F(ResourcePoolTest, GrowthFailureIsReported) {
    backend_->failOnAttempt(2);
    auto pool = makePool();

    auto held = pool->acquire();
    EXPECT_EQ(errorOf([&] { pool->acquire(); }), PoolError::Initialization);
    EXPECT_EQ(pool->activeCount(), 1u);
    pool->release(held);
}

TEST_F(ResourcePoolTest, ResourceIdsAreNeverReused) {
    config_.idle_timeout = 10ms;
    auto pool = makePool();

    auto a = pool->acquire();
    auto b = pool->acquire();
    EXPECT_NE(a->id(), b->id());
    pool->release(a);
    pool->release(b);

    // Shrink back to one resource, then grow again
    std::this_thread::sleep_for(30ms);
    pool->reapIdle();
    ASSERT_EQ(pool->activeCount(), 1u);

    auto c = pool->acquire();
    auto d = pool->acquire();
    std::set<int> ids{a->id(), b->id()};
    EXPECT_TRUE(ids.count(c->id()) == 1);
    EXPECT_TRUE(ids.count(d->id()) == 0);
    pool->release(c);
    pool->release(d);
}

// Scenario: three concurrent commands against Min=1, Max=2 with slow commands

TEST_F(ResourcePoolTest, ConcurrentCommandsNeverCreateThirdResource) {
    backend_->commandDelay(100ms);
    auto pool = makePool();

    std::vector<std::future<std::string>> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(std::async(std::launch::async, [&pool] {
            try {
                return pool->executeCommand("echo", "ok");
            } catch (const PoolException& e) {
                return std::string(ErrorHandler::errorName(e.code()));
            }
        }));
    }

    int succeeded = 0;
    int timedOut = 0;
    for (auto& call : calls) {
        std::string result = call.get();
        if (result == "ok") {
            succeeded++;
        } else {
            EXPECT_EQ(result, "acquire_timeout");
            timedOut++;
        }
    }

    EXPECT_EQ(succeeded + timedOut, 3);
    EXPECT_GE(succeeded, 2);
    EXPECT_EQ(backend_->stats().initialized, 2);
    EXPECT_EQ(pool->activeCount(), 2u);
}

// Properties under concurrent load

TEST_F(ResourcePoolTest, ConcurrentLoadRespectsInvariants) {
    config_.max_pool_size = 3;
    config_.wait_conn_timeout = 10ms;
    backend_->commandDelay(1ms);
    auto pool = makePool();

    std::atomic<bool> done{false};
    std::atomic<size_t> maxActive{0};
    std::thread monitor([&] {
        while (!done) {
            size_t active = pool->activeCount();
            size_t seen = maxActive.load();
            while (active > seen && !maxActive.compare_exchange_weak(seen, active)) {
            }
            std::this_thread::sleep_for(100us);
        }
    });

    std::mutex heldMutex;
    std::set<int> held;
    std::atomic<int> doubleCheckouts{0};
    std::atomic<int> notBusy{0};

    std::vector<std::thread> callers;
    for (int t = 0; t < 8; ++t) {
        callers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                try {
                    auto record = pool->acquire();
                    if (!record->isBusy()) notBusy++;
                    {
                        std::lock_guard<std::mutex> lock(heldMutex);
                        if (!held.insert(record->id()).second) doubleCheckouts++;
                    }
                    record->executeCommand(Command{"echo", "x"}, 2s);
                    {
                        std::lock_guard<std::mutex> lock(heldMutex);
                        held.erase(record->id());
                    }
                    pool->release(record);
                } catch (const PoolException& e) {
                    EXPECT_EQ(e.code(), PoolError::AcquireTimeout);
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    done = true;
    monitor.join();

    EXPECT_LE(maxActive.load(), 3u);
    EXPECT_LE(backend_->stats().initialized, 3);
    EXPECT_EQ(doubleCheckouts, 0);
    EXPECT_EQ(notBusy, 0);
    EXPECT_EQ(backend_->stats().reentered, 0);
    EXPECT_EQ(backend_->stats().wrongThread, 0);

    // Everything is back and idle
    EXPECT_EQ(pool->availableCount(), pool->activeCount());
    for (const auto& resource : pool->status().resources) {
        EXPECT_FALSE(resource.busy);
    }
}

TEST_F(ResourcePoolTest, ConcurrentExecuteNeverReentersHandle) {
    config_.max_pool_size = 2;
    config_.wait_conn_timeout = 1s;
    backend_->commandDelay(2ms);
    auto pool = makePool();

    std::vector<std::thread> callers;
    for (int t = 0; t < 6; ++t) {
        callers.emplace_back([&pool] {
            for (int i = 0; i < 10; ++i) {
                EXPECT_EQ(pool->executeCommand("echo", "x"), "x");
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(backend_->stats().executed, 60);
    EXPECT_EQ(backend_->stats().reentered, 0);
    EXPECT_EQ(backend_->stats().wrongThread, 0);
}

// Idle reaping

TEST_F(ResourcePoolTest, ReaperShrinksToMinimum) {
    config_.idle_timeout = 10ms;
    config_.cleanup_idle_interval = 5ms;
    config_.min_pool_size = 0;
    config_.max_pool_size = 3;
    config_.wait_conn_timeout = 20ms;
    auto pool = makePool();

    std::vector<std::shared_ptr<ResourceRecord>> records;
    for (int i = 0; i < 3; ++i) {
        records.push_back(pool->acquire());
    }
    ASSERT_EQ(pool->activeCount(), 3u);
    for (const auto& record : records) {
        pool->release(record);
    }

    EXPECT_TRUE(eventually([&] { return pool->activeCount() == 1; }));

    // Never below the minimum
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(pool->activeCount(), 1u);
    EXPECT_EQ(pool->availableCount(), 1u);
    EXPECT_EQ(backend_->stats().released, 2);
}

TEST_F(ResourcePoolTest, ReaperLeavesBusyResourcesAlone) {
    config_.idle_timeout = 10ms;
    config_.cleanup_idle_interval = 5ms;
    auto pool = makePool();

    auto first = pool->acquire();
    auto second = pool->acquire();
    std::this_thread::sleep_for(60ms);

    EXPECT_EQ(pool->activeCount(), 2u);
    EXPECT_EQ(backend_->stats().released, 0);

    pool->release(first);
    pool->release(second);
}

TEST_F(ResourcePoolTest, ReapIdleSkipsRecentlyUsedResources) {
    config_.idle_timeout = 1h;
    auto pool = makePool();

    auto first = pool->acquire();
    auto second = pool->acquire();
    pool->release(first);
    pool->release(second);

    pool->reapIdle();
    EXPECT_EQ(pool->activeCount(), 2u);
}

TEST_F(ResourcePoolTest, ReapIdleOnDemand) {
    config_.idle_timeout = 10ms;
    auto pool = makePool();

    auto first = pool->acquire();
    auto second = pool->acquire();
    pool->release(first);
    pool->release(second);

    std::this_thread::sleep_for(30ms);
    pool->reapIdle();
    EXPECT_EQ(pool->activeCount(), 1u);
    EXPECT_EQ(pool->availableCount(), 1u);
    EXPECT_EQ(pool->executeCommand("echo", "survivor"), "survivor");
}

// Shutdown

TEST_F(ResourcePoolTest, CloseIsIdempotent) {
    config_.min_pool_size = 2;
    auto pool = makePool();

    pool->close();
    EXPECT_NO_THROW(pool->close());

    EXPECT_TRUE(pool->isShutdown());
    EXPECT_FALSE(pool->healthCheck());
    EXPECT_EQ(pool->activeCount(), 0u);
    EXPECT_EQ(backend_->stats().released, 2);
}

TEST_F(ResourcePoolTest, ConcurrentCloseTearsDownOnce) {
    config_.min_pool_size = 2;
    config_.max_pool_size = 2;
    auto pool = makePool();

    std::vector<std::thread> closers;
    for (int i = 0; i < 4; ++i) {
        closers.emplace_back([&pool] { pool->close(); });
    }
    for (auto& closer : closers) {
        closer.join();
    }

    EXPECT_EQ(backend_->stats().released, 2);
    pool.reset();
    EXPECT_EQ(backend_->stats().released, 2);
}

TEST_F(ResourcePoolTest, AcquireAfterCloseFails) {
    auto pool = makePool();
    pool->close();

    EXPECT_EQ(errorOf([&] { pool->acquire(); }), PoolError::ShutdownInProgress);
    EXPECT_EQ(errorOf([&] { pool->executeCommand("echo", "x"); }),
              PoolError::ShutdownInProgress);
}

TEST_F(ResourcePoolTest, CloseWakesWaitingAcquirer) {
    config_.max_pool_size = 1;
    config_.wait_conn_timeout = 10s;
    auto pool = makePool();

    auto held = pool->acquire();
    auto waiter = std::async(std::launch::async, [&] {
        return errorOf([&] { pool->acquire(); });
    });

    std::this_thread::sleep_for(30ms);
    pool->close();

    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(waiter.get(), PoolError::ShutdownInProgress);

    // Releasing into a closed pool is harmless
    pool->release(held);
    EXPECT_EQ(backend_->stats().released, 1);
}

TEST_F(ResourcePoolTest, CloseDoesNotHangOnStuckWorker) {
    config_.min_pool_size = 2;
    config_.worker_close_timeout = 30ms;
    backend_->releaseDelay(300ms);
    auto pool = makePool();

    auto start = std::chrono::steady_clock::now();
    pool->close();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(pool->activeCount(), 0u);
}

// Status

TEST_F(ResourcePoolTest, StatusReportsEveryResource) {
    auto pool = makePool();

    auto first = pool->acquire();
    auto second = pool->acquire();
    pool->release(second);

    PoolStatus status = pool->status();
    EXPECT_EQ(status.activeCount, 2u);
    EXPECT_EQ(status.availableCount, 1u);
    EXPECT_FALSE(status.shutdown);
    ASSERT_EQ(status.resources.size(), 2u);

    for (const auto& resource : status.resources) {
        EXPECT_EQ(resource.useCount, 1);
        EXPECT_EQ(resource.busy, resource.id == first->id());
    }

    pool->release(first);
}

TEST_F(ResourcePoolTest, StatusDoesNotWaitForRunningCommands) {
    backend_->commandDelay(300ms);
    auto pool = makePool();

    auto command = std::async(std::launch::async, [&] {
        return pool->executeCommand("echo", "slow");
    });
    std::this_thread::sleep_for(30ms);

    auto start = std::chrono::steady_clock::now();
    PoolStatus status = pool->status();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
    ASSERT_EQ(status.resources.size(), 1u);
    EXPECT_TRUE(status.resources.front().busy);

    EXPECT_EQ(command.get(), "slow");
}

// Mocked handle

TEST_F(ResourcePoolTest, DrivesBackendHandleThroughItsInterface) {
    auto handle = std::make_unique<MockResourceHandle>();
    EXPECT_CALL(*handle, execute(::testing::Field(&Command::operation, "ping")))
        .Times(2)
        .WillRepeatedly(::testing::Return(ResultPayload(std::string("pong"))));
    EXPECT_CALL(*handle, release()).Times(1);

    auto pool = std::make_unique<ResourcePool>(config_,
        std::make_shared<MockBackend>(std::move(handle)));

    EXPECT_EQ(pool->executeCommand("ping", ""), "pong");
    EXPECT_EQ(pool->executeCommand("ping", "again"), "pong");
    pool->close();
}
