/**
 * klog - Command Runner Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "MemoryFilesystem.hpp"
#include "cli/CommandRunner.hpp"
#include "store/EntryStore.hpp"

using klog::CommandRunner;
using klog::EntryStore;
using klog::ExitCode;
using klog::test::MemoryFilesystem;
using klog::test::MemoryTree;

class CommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree = std::make_shared<MemoryTree>();
        tree->files["2024/01/05-0.txt"] =
            "BEGIN: 2024-01-05\nEND: None\nTOPIC: Fridge\nAPPENDIX: None\n"
            "MEDIA: receipt.pdf\n\nCleaned it.\n";
        tree->files["media/2024/01/05/0/receipt.pdf"] = "PDF";
        tree->files["2023/12/24-0.txt"] =
            "BEGIN: 2023-12-24\nEND: 2023-12-26\nTOPIC: Holidays\nAPPENDIX: None\n\nVisited family.\n";
    }

    ExitCode run(const std::vector<std::string>& args, const std::string& input = "") {
        out.str("");
        err.str("");
        EntryStore store(std::make_unique<MemoryFilesystem>(tree));
        std::istringstream in(input);
        CommandRunner runner(store, in, out, err);
        return runner.run(args);
    }

    std::shared_ptr<MemoryTree> tree;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CommandRunnerTest, ListsEntriesByYear) {
    EXPECT_EQ(run({"list"}), ExitCode::Success);
    EXPECT_EQ(out.str(),
              "2024\n"
              "  [0] 2024-01-05: Fridge (1 media)\n"
              "2023\n"
              "  [1] 2023-12-24 - 2023-12-26: Holidays\n");
}

TEST_F(CommandRunnerTest, ListsEmptyStore) {
    tree->files.clear();
    EXPECT_EQ(run({"list"}), ExitCode::Success);
    EXPECT_EQ(out.str(), "No entries\n");
}

TEST_F(CommandRunnerTest, ShowsEntryText) {
    EXPECT_EQ(run({"show", "1"}), ExitCode::Success);
    EXPECT_EQ(out.str(),
              "BEGIN: 2023-12-24\nEND: 2023-12-26\nTOPIC: Holidays\nAPPENDIX: None\n\nVisited family.\n");
}

TEST_F(CommandRunnerTest, RejectsUnknownOrdinal) {
    EXPECT_EQ(run({"show", "7"}), ExitCode::UsageError);
    EXPECT_EQ(err.str(), "No entry 7\n");

    EXPECT_EQ(run({"show", "-1"}), ExitCode::UsageError);
    EXPECT_EQ(run({"show"}), ExitCode::UsageError);
}

TEST_F(CommandRunnerTest, RejectsUnknownCommand) {
    EXPECT_EQ(run({"frobnicate"}), ExitCode::UsageError);
    EXPECT_EQ(err.str().rfind("Unknown command: frobnicate\n", 0), 0u);

    EXPECT_EQ(run({}), ExitCode::UsageError);
}

TEST_F(CommandRunnerTest, PrintsTemplateForDate) {
    EXPECT_EQ(run({"template", "2024-02-29"}), ExitCode::Success);
    EXPECT_NE(out.str().find("BEGIN: 2024-02-29\n"), std::string::npos);
    EXPECT_NE(out.str().find("TOPIC: New entry\n"), std::string::npos);

    EXPECT_EQ(run({"template", "2023-02-29"}), ExitCode::UsageError);
}

TEST_F(CommandRunnerTest, CreatesEntryFromInput) {
    auto code = run({"new", "-"},
                    "BEGIN: 2024-01-05\nTOPIC: Dishwasher\n\nDescaled.\n");

    EXPECT_EQ(code, ExitCode::Success);
    EXPECT_EQ(out.str(), "Created 2024-01-05: Dishwasher\n");
    ASSERT_TRUE(tree->hasFile("2024/01/05-1.txt"));
    EXPECT_EQ(tree->files["2024/01/05-1.txt"],
              "BEGIN: 2024-01-05\nEND: None\nTOPIC: Dishwasher\nAPPENDIX: None\n\nDescaled.\n");
}

TEST_F(CommandRunnerTest, RejectsInvalidNewEntry) {
    auto code = run({"new", "-"}, "BEGIN: 2024-01-05\nTOPIC: Empty\n\n");

    EXPECT_EQ(code, ExitCode::FormatFailure);
    EXPECT_EQ(err.str(), "Invalid entry: empty content\n");
    EXPECT_EQ(tree->files.size(), 3u);
}

TEST_F(CommandRunnerTest, NewEntryWithMediaLeavesStoreUntouched) {
    EntryStore store(std::make_unique<MemoryFilesystem>(tree));
    std::istringstream in("BEGIN: 2024-01-05\nTOPIC: Sneaky\nMEDIA: photo.jpg\n\nText.\n");
    CommandRunner runner(store, in, out, err);

    EXPECT_EQ(runner.run({"new", "-"}), ExitCode::FormatFailure);
    EXPECT_EQ(err.str(), "Invalid entry: direct adding of media is not supported\n");
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(tree->files.size(), 3u);
}

TEST_F(CommandRunnerTest, EditsEntry) {
    auto code = run({"edit", "0", "-"},
                    "BEGIN: 2024-01-05\nTOPIC: Fridge\nMEDIA: receipt.pdf\n\nCleaned it twice.\n");

    EXPECT_EQ(code, ExitCode::Success);
    EXPECT_EQ(out.str(), "Modified 2024-01-05: Fridge\n");
    EXPECT_NE(tree->files["2024/01/05-0.txt"].find("Cleaned it twice."), std::string::npos);
}

TEST_F(CommandRunnerTest, EditWithSameTextChangesNothing) {
    const std::string before = tree->files["2024/01/05-0.txt"];

    EXPECT_EQ(run({"edit", "0", "-"}, before + "\n\n"), ExitCode::Success);
    EXPECT_EQ(out.str(), "Nothing changed\n");
}

TEST_F(CommandRunnerTest, EditCannotAddMedia) {
    auto code = run({"edit", "1", "-"},
                    "BEGIN: 2023-12-24\nTOPIC: Holidays\nMEDIA: photo.jpg\n\nVisited family.\n");

    EXPECT_EQ(code, ExitCode::FormatFailure);
    EXPECT_EQ(err.str(), "Invalid entry: direct adding of media is not supported\n");
}

TEST_F(CommandRunnerTest, RemovesEntryAndMedia) {
    EXPECT_EQ(run({"remove", "0"}), ExitCode::Success);
    EXPECT_EQ(out.str(), "Removed 2024-01-05: Fridge\n");
    EXPECT_FALSE(tree->hasFile("2024/01/05-0.txt"));
    EXPECT_FALSE(tree->hasFile("media/2024/01/05/0/receipt.pdf"));
    EXPECT_TRUE(tree->hasFile("2023/12/24-0.txt"));
}

TEST_F(CommandRunnerTest, AttachesLocalFile) {
    auto source = std::filesystem::temp_directory_path() / "klog-attach-test.txt";
    {
        std::ofstream file(source, std::ios::binary);
        file << "shopping list";
    }

    auto code = run({"attach", "1", source.string()});
    std::filesystem::remove(source);

    EXPECT_EQ(code, ExitCode::Success);
    EXPECT_EQ(tree->files["media/2023/12/24/0/klog-attach-test.txt"], "shopping list");
    EXPECT_NE(tree->files["2023/12/24-0.txt"].find("MEDIA: klog-attach-test.txt\n"),
              std::string::npos);
}

TEST_F(CommandRunnerTest, AttachMissingFileIsIoFailure) {
    EXPECT_EQ(run({"attach", "1", "/nonexistent/klog/file.txt"}), ExitCode::IoFailure);
}

TEST_F(CommandRunnerTest, DetachesByOrdinal) {
    EXPECT_EQ(run({"detach", "0", "1"}), ExitCode::UsageError);

    EXPECT_EQ(run({"detach", "0", "0"}), ExitCode::Success);
    EXPECT_FALSE(tree->hasFile("media/2024/01/05/0/receipt.pdf"));
    EXPECT_EQ(tree->files["2024/01/05-0.txt"].find("MEDIA:"), std::string::npos);
}

TEST_F(CommandRunnerTest, ReportsSaveFailures) {
    tree->failingWrites.insert("2024/01/05-0.txt");

    auto code = run({"edit", "0", "-"},
                    "BEGIN: 2024-01-05\nTOPIC: Fridge\nMEDIA: receipt.pdf\n\nAgain.\n");

    EXPECT_EQ(code, ExitCode::IoFailure);
    EXPECT_EQ(err.str().rfind("Failed to save 2024-01-05: Fridge: ", 0), 0u);
}
