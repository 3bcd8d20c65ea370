#include "bulkup/transfer/validator.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using bulkup::testing::TempDir;
using bulkup::testing::write_file;
using bulkup::transfer::CandidateFile;
using bulkup::transfer::DefaultFileValidator;
using bulkup::transfer::build_candidate;

class ValidatorTest : public ::testing::Test {
protected:
    bulkup::transfer::CandidateRef make(const fs::path& relative, const std::string& content) {
        write_file(root_.path() / relative, content);
        return build_candidate(root_.path(), root_.path() / relative).value();
    }

    TempDir root_{"bulkup_validator_test_"};
    DefaultFileValidator validator_;
};

TEST_F(ValidatorTest, AcceptsNonEmptyRegularFile) {
    auto verdict = validator_.validate(*make("data.csv", "1,2,3"));
    EXPECT_TRUE(verdict.valid);
    EXPECT_TRUE(verdict.reasons.empty());
}

TEST_F(ValidatorTest, RejectsEmptyFile) {
    auto verdict = validator_.validate(*make("empty.txt", ""));
    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.reasons, std::vector<std::string>{"Empty file"});
}

TEST_F(ValidatorTest, RejectsDisallowedMediaType) {
    auto verdict = validator_.validate(*make("tool.exe", "MZ"));
    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.reasons, std::vector<std::string>{"Invalid MIME type: application/x-msdownload"});
}

TEST_F(ValidatorTest, CollectsEveryReason) {
    auto verdict = validator_.validate(*make("blob.bin", ""));
    EXPECT_FALSE(verdict.valid);
    ASSERT_EQ(verdict.reasons.size(), 2u);
    EXPECT_EQ(verdict.reasons[0], "Invalid MIME type: application/octet-stream");
    EXPECT_EQ(verdict.reasons[1], "Empty file");
}

TEST_F(ValidatorTest, RejectsDirectories) {
    fs::create_directories(root_.path() / "folder.txt");
    auto candidate = build_candidate(root_.path(), root_.path() / "folder.txt").value();

    auto verdict = validator_.validate(*candidate);
    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.reasons, std::vector<std::string>{"Not a file"});
}

TEST_F(ValidatorTest, RejectsFileRemovedAfterDiscovery) {
    auto candidate = make("gone.txt", "soon gone");
    fs::remove(root_.path() / "gone.txt");

    auto verdict = validator_.validate(*candidate);
    EXPECT_FALSE(verdict.valid);
    EXPECT_EQ(verdict.reasons, std::vector<std::string>{"Not a file"});
}

TEST_F(ValidatorTest, CustomDenyList) {
    DefaultFileValidator strict({"text/plain"});
    auto verdict = strict.validate(*make("notes.txt", "hello"));
    EXPECT_FALSE(verdict.valid);

    auto binary = strict.validate(*make("blob.bin", "payload"));
    EXPECT_TRUE(binary.valid);
}
