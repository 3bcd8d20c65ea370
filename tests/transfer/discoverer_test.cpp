#include "bulkup/transfer/discoverer.hpp"

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using bulkup::Clock;
using bulkup::ErrorCode;
using bulkup::persistence::PersistedEntry;
using bulkup::persistence::PersistenceStore;
using bulkup::testing::TempDir;
using bulkup::testing::write_file;
using bulkup::transfer::DefaultFileValidator;
using bulkup::transfer::Discoverer;
using bulkup::transfer::DiscoveryOptions;
using bulkup::transfer::TransferWorkload;
using bulkup::transfer::kAlreadyUploadedReason;

class DiscovererTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<PersistenceStore>(root_.path(), state_.path());
    }

    std::vector<std::string> pending_names(const TransferWorkload& workload) const {
        std::vector<std::string> names;
        for (const auto& candidate : workload.pending()) {
            names.push_back(candidate->relative_path());
        }
        return names;
    }

    void mark_uploaded(const std::string& relative) {
        auto candidate = bulkup::transfer::build_candidate(root_.path(), root_.path() / relative).value();
        store_->save(*candidate);
    }

    TempDir root_{"bulkup_discover_root_"};
    TempDir state_{"bulkup_discover_state_"};
    std::unique_ptr<PersistenceStore> store_;
    DefaultFileValidator validator_;
};

TEST_F(DiscovererTest, FirstRunQueuesEveryValidFile) {
    write_file(root_.path() / "a.txt", "alpha");
    write_file(root_.path() / "nested" / "b.csv", "1,2");
    write_file(root_.path() / "nested" / "deeper" / "c.json", "{}");
    write_file(root_.path() / "empty.txt", "");
    write_file(root_.path() / "setup.exe", "MZ");

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    auto result = discoverer.discover(root_.path(), workload);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto names = pending_names(workload);
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "nested/b.csv", "nested/deeper/c.json"}));
    EXPECT_EQ(workload.total_bytes(), 5u + 3u + 2u);
    EXPECT_EQ(result.value().pending.size(), 3u);
    EXPECT_EQ(result.value().total_bytes, 10u);

    const auto skipped = workload.skipped();
    ASSERT_EQ(skipped.size(), 2u);
    EXPECT_EQ(result.value().skipped.size(), 2u);
    for (const auto& record : skipped) {
        ASSERT_FALSE(record.reasons.empty());
        if (record.path.filename() == "empty.txt") {
            EXPECT_EQ(record.reasons.front(), "Empty file");
        } else {
            EXPECT_EQ(record.path.filename().string(), "setup.exe");
            EXPECT_EQ(record.reasons.front(), "Invalid MIME type: application/x-msdownload");
        }
    }

    ASSERT_TRUE(workload.discovery_started_at().has_value());
    ASSERT_TRUE(workload.discovery_finished_at().has_value());
    EXPECT_LE(*workload.discovery_started_at(), *workload.discovery_finished_at());
}

TEST_F(DiscovererTest, UnchangedUploadedFilesAreSkipped) {
    write_file(root_.path() / "a.txt", "alpha");
    write_file(root_.path() / "b.txt", "beta");
    write_file(root_.path() / "c.txt", "gamma");
    mark_uploaded("a.txt");
    mark_uploaded("b.txt");

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(pending_names(workload), std::vector<std::string>{"c.txt"});
    const auto skipped = workload.skipped();
    ASSERT_EQ(skipped.size(), 2u);
    for (const auto& record : skipped) {
        EXPECT_EQ(record.reasons, std::vector<std::string>{kAlreadyUploadedReason});
    }
    EXPECT_EQ(store_->load().size(), 2u);
}

TEST_F(DiscovererTest, ChangedContentIsQueuedAndStaleRecordDropped) {
    write_file(root_.path() / "a.txt", "alpha");
    mark_uploaded("a.txt");
    write_file(root_.path() / "a.txt", "alpha, revised");

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(pending_names(workload), std::vector<std::string>{"a.txt"});
    EXPECT_TRUE(workload.skipped().empty());
    EXPECT_TRUE(store_->load().empty());
}

TEST_F(DiscovererTest, ExpiredRecordIsQueuedAndDropped) {
    write_file(root_.path() / "old.txt", "ancient");
    write_file(root_.path() / "recent.txt", "fresh");
    const auto old_candidate = bulkup::transfer::build_candidate(root_.path(), root_.path() / "old.txt").value();
    const auto recent_candidate = bulkup::transfer::build_candidate(root_.path(), root_.path() / "recent.txt").value();

    PersistedEntry old_entry;
    old_entry.resolved_path = old_candidate->resolved_path();
    old_entry.fingerprint = old_candidate->fingerprint(store_->fingerprinter()).value();
    old_entry.uploaded_at = Clock::now() - 31 * 24h;
    store_->append(old_entry);

    PersistedEntry recent_entry;
    recent_entry.resolved_path = recent_candidate->resolved_path();
    recent_entry.fingerprint = recent_candidate->fingerprint(store_->fingerprinter()).value();
    recent_entry.uploaded_at = Clock::now() - 29 * 24h;
    store_->append(recent_entry);

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(pending_names(workload), std::vector<std::string>{"old.txt"});
    const auto persisted = store_->load();
    EXPECT_EQ(persisted.size(), 1u);
    EXPECT_EQ(persisted.count(recent_candidate->resolved_path()), 1u);
}

TEST_F(DiscovererTest, ShorterResumeWindowExpiresSooner) {
    write_file(root_.path() / "a.txt", "alpha");
    const auto candidate = bulkup::transfer::build_candidate(root_.path(), root_.path() / "a.txt").value();
    PersistedEntry entry;
    entry.resolved_path = candidate->resolved_path();
    entry.fingerprint = candidate->fingerprint(store_->fingerprinter()).value();
    entry.uploaded_at = Clock::now() - 3h;
    store_->append(entry);

    DiscoveryOptions options;
    options.max_resume_age = 1h;
    Discoverer discoverer(validator_, *store_, options);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(pending_names(workload), std::vector<std::string>{"a.txt"});
}

TEST_F(DiscovererTest, VeryLongResumeWindowKeepsFreshRecords) {
    write_file(root_.path() / "a.txt", "alpha");
    const auto candidate = bulkup::transfer::build_candidate(root_.path(), root_.path() / "a.txt").value();
    PersistedEntry entry;
    entry.resolved_path = candidate->resolved_path();
    entry.fingerprint = candidate->fingerprint(store_->fingerprinter()).value();
    entry.uploaded_at = Clock::now() - 1h;
    store_->append(entry);

    DiscoveryOptions options;
    options.max_resume_age = std::chrono::hours(24 * 200000);
    Discoverer discoverer(validator_, *store_, options);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_TRUE(workload.pending().empty());
    EXPECT_EQ(store_->load().size(), 1u);
}

TEST_F(DiscovererTest, DisabledPersistenceQueuesEverything) {
    write_file(root_.path() / "a.txt", "alpha");
    mark_uploaded("a.txt");

    PersistenceStore disabled(root_.path(), state_.path(), false);
    Discoverer discoverer(validator_, disabled);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(pending_names(workload), std::vector<std::string>{"a.txt"});
}

TEST_F(DiscovererTest, MissingRootIsErrorAndLeavesWorkloadAlone) {
    write_file(root_.path() / "keep.txt", "keep");
    TransferWorkload workload;
    workload.register_candidate(
        bulkup::transfer::build_candidate(root_.path(), root_.path() / "keep.txt").value());

    Discoverer discoverer(validator_, *store_);
    auto result = discoverer.discover(root_.path() / "does-not-exist", workload);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::RootNotFound);
    EXPECT_EQ(workload.total_files(), 1u);
}

TEST_F(DiscovererTest, FileRootIsNotADirectory) {
    write_file(root_.path() / "plain.txt", "text");

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    auto result = discoverer.discover(root_.path() / "plain.txt", workload);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotADirectory);
}

TEST_F(DiscovererTest, RediscoveryReplacesPreviousState) {
    write_file(root_.path() / "a.txt", "alpha");

    Discoverer discoverer(validator_, *store_);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(workload.total_files(), 1u);
    EXPECT_EQ(workload.total_bytes(), 5u);
}

TEST_F(DiscovererTest, EmitsSkipAndCompletionEvents) {
    write_file(root_.path() / "a.txt", "alpha");
    write_file(root_.path() / "empty.txt", "");

    bulkup::events::EventBus bus;
    std::vector<std::string> skipped_paths;
    std::size_t completions = 0;
    std::size_t reported_pending = 0;
    bus.subscribe<bulkup::events::FileSkippedEvent>([&](const bulkup::events::FileSkippedEvent& e) {
        skipped_paths.push_back(fs::path(e.path).filename().string());
    });
    bus.subscribe<bulkup::events::DiscoveryCompletedEvent>([&](const bulkup::events::DiscoveryCompletedEvent& e) {
        ++completions;
        reported_pending = e.pending_files;
    });

    Discoverer discoverer(validator_, *store_, DiscoveryOptions{}, &bus);
    TransferWorkload workload;
    ASSERT_TRUE(discoverer.discover(root_.path(), workload).is_ok());

    EXPECT_EQ(skipped_paths, std::vector<std::string>{"empty.txt"});
    EXPECT_EQ(completions, 1u);
    EXPECT_EQ(reported_pending, 1u);
}
