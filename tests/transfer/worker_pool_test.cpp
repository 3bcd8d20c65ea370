#include "bulkup/transfer/worker_pool.hpp"

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include "support/memory_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using bulkup::Clock;
using bulkup::testing::MemoryTransport;
using bulkup::transfer::CandidateFile;
using bulkup::transfer::CandidateRef;
using bulkup::transfer::PoolSummary;
using bulkup::transfer::TransferWorkload;
using bulkup::transfer::WorkerPool;
using bulkup::transfer::WorkerPoolOptions;

namespace {

CandidateRef make_candidate(const std::string& name, std::uint64_t size = 10) {
    return std::make_shared<const CandidateFile>(
        fs::path("/data") / name, name, ".", size, "text/plain", "rw-r--r--", Clock::now());
}

void fill(TransferWorkload& workload, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        workload.register_candidate(make_candidate("file_" + std::to_string(i) + ".txt"));
    }
}

WorkerPoolOptions options_with(std::size_t concurrency) {
    WorkerPoolOptions options;
    options.concurrency = concurrency;
    options.idle_backoff = 1ms;
    return options;
}

} // namespace

TEST(WorkerPool, DrainsEveryCandidate) {
    TransferWorkload workload;
    fill(workload, 40);
    MemoryTransport transport;

    WorkerPool pool(workload, transport, options_with(4));
    const PoolSummary summary = pool.run();

    EXPECT_EQ(summary.attempted, 40u);
    EXPECT_EQ(summary.succeeded, 40u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(summary.stopped);

    const auto counts = workload.counts();
    EXPECT_EQ(counts.completed, 40u);
    EXPECT_EQ(counts.pending, 0u);
    EXPECT_EQ(counts.in_progress, 0u);
    EXPECT_EQ(workload.remaining_bytes(), 0u);

    const auto uploaded = transport.uploaded();
    EXPECT_EQ(std::set<std::string>(uploaded.begin(), uploaded.end()).size(), 40u);
}

TEST(WorkerPool, EmptyWorkloadReturnsImmediately) {
    TransferWorkload workload;
    MemoryTransport transport;

    WorkerPool pool(workload, transport, options_with(3));
    const auto summary = pool.run();

    EXPECT_EQ(summary.attempted, 0u);
    EXPECT_TRUE(transport.calls().empty());
}

TEST(WorkerPool, FailuresAreRecordedWithReason) {
    TransferWorkload workload;
    fill(workload, 6);
    MemoryTransport transport;
    transport.fail("file_2.txt", "connection reset by peer");
    transport.fail("file_4.txt", "quota exceeded");

    WorkerPool pool(workload, transport, options_with(2));
    const auto summary = pool.run();

    EXPECT_EQ(summary.succeeded, 4u);
    EXPECT_EQ(summary.failed, 2u);

    const auto failed = workload.failed();
    ASSERT_EQ(failed.size(), 2u);
    for (const auto& record : failed) {
        ASSERT_TRUE(record.reason.has_value());
        if (record.candidate->name() == "file_2.txt") {
            EXPECT_EQ(*record.reason, "connection reset by peer");
        } else {
            EXPECT_EQ(record.candidate->name(), "file_4.txt");
            EXPECT_EQ(*record.reason, "quota exceeded");
        }
    }
    EXPECT_EQ(workload.completed().size(), 4u);
}

TEST(WorkerPool, ThrowingTransportBecomesFailure) {
    TransferWorkload workload;
    fill(workload, 3);
    MemoryTransport transport;
    transport.throw_on("file_1.txt");

    WorkerPool pool(workload, transport, options_with(1));
    const auto summary = pool.run();

    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.succeeded, 2u);
    const auto failed = workload.failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed.front().reason.value_or(""), "Transport threw: simulated transport crash");
}

TEST(WorkerPool, NeverExceedsConfiguredConcurrency) {
    TransferWorkload workload;
    fill(workload, 24);
    MemoryTransport transport;
    transport.set_delay(5ms);

    WorkerPool pool(workload, transport, options_with(3));
    pool.run();

    EXPECT_GE(transport.peak_concurrency(), 1);
    EXPECT_LE(transport.peak_concurrency(), 3);
    EXPECT_EQ(workload.completed().size(), 24u);
}

TEST(WorkerPool, ZeroConcurrencyIsClampedToOne) {
    TransferWorkload workload;
    fill(workload, 5);
    MemoryTransport transport;

    WorkerPool pool(workload, transport, options_with(0));
    pool.run();

    EXPECT_EQ(transport.peak_concurrency(), 1);
    EXPECT_EQ(workload.completed().size(), 5u);
}

TEST(WorkerPool, SequentialWorkerKeepsDiscoveryOrder) {
    TransferWorkload workload;
    fill(workload, 5);
    MemoryTransport transport;

    WorkerPool pool(workload, transport, options_with(1));
    pool.run();

    EXPECT_EQ(transport.calls(),
              (std::vector<std::string>{"file_0.txt", "file_1.txt", "file_2.txt", "file_3.txt", "file_4.txt"}));
}

TEST(WorkerPool, RemainingFilesNeverGrowsWhileDraining) {
    TransferWorkload workload;
    fill(workload, 30);
    MemoryTransport transport;
    transport.set_delay(2ms);
    transport.fail("file_7.txt", "rejected");

    std::atomic<bool> done{false};
    std::vector<std::size_t> samples;
    std::thread sampler([&]() {
        while (!done) {
            samples.push_back(workload.remaining_files());
            std::this_thread::sleep_for(500us);
        }
        samples.push_back(workload.remaining_files());
    });

    WorkerPool pool(workload, transport, options_with(4));
    pool.run();
    done = true;
    sampler.join();

    ASSERT_GE(samples.size(), 2u);
    EXPECT_TRUE(std::is_sorted(samples.rbegin(), samples.rend()));
    EXPECT_LE(samples.front(), 30u);
    EXPECT_EQ(samples.back(), 0u);
}

TEST(WorkerPool, StopLeavesUnstartedWorkPending) {
    TransferWorkload workload;
    fill(workload, 10);
    MemoryTransport transport;

    WorkerPool pool(workload, transport, options_with(1));
    std::atomic<int> seen{0};
    transport.on_upload([&](const CandidateFile&) {
        if (++seen == 3) {
            pool.request_stop();
        }
    });

    const auto summary = pool.run();

    EXPECT_TRUE(pool.stop_requested());
    EXPECT_TRUE(summary.stopped);
    EXPECT_EQ(summary.attempted, 3u);
    EXPECT_EQ(workload.completed().size(), 3u);
    EXPECT_EQ(workload.pending().size(), 7u);
    EXPECT_TRUE(workload.in_progress().empty());
}

TEST(WorkerPool, EmitsPerFileEvents) {
    TransferWorkload workload;
    fill(workload, 4);
    MemoryTransport transport;
    transport.fail("file_3.txt", "rejected");

    bulkup::events::EventBus bus;
    std::atomic<int> started{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    bus.subscribe<bulkup::events::FileUploadStartedEvent>(
        [&](const bulkup::events::FileUploadStartedEvent&) { started++; });
    bus.subscribe<bulkup::events::FileUploadCompletedEvent>(
        [&](const bulkup::events::FileUploadCompletedEvent& e) {
            EXPECT_EQ(e.remote_path.rfind("/remote/", 0), 0u);
            completed++;
        });
    bus.subscribe<bulkup::events::FileUploadFailedEvent>(
        [&](const bulkup::events::FileUploadFailedEvent& e) {
            EXPECT_EQ(e.reason, "rejected");
            failed++;
        });

    WorkerPool pool(workload, transport, options_with(2), &bus);
    pool.run();

    EXPECT_EQ(started.load(), 4);
    EXPECT_EQ(completed.load(), 3);
    EXPECT_EQ(failed.load(), 1);
}
