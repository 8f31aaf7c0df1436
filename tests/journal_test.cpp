#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "floorstock/errors.hpp"
#include "floorstock/events.pb.h"
#include "floorstock/helpers.hpp"
#include "floorstock/journal.hpp"

using namespace floorstock;

namespace {

events::LocationRegistered location_event(const std::string& code) {
    events::LocationRegistered event;
    event.mutable_location()->set_code(code);
    event.mutable_location()->set_name(code);
    return event;
}

} // anonymous namespace

// =============================================================================
// MemoryJournal Tests
// =============================================================================

TEST(MemoryJournalTest, Append_ShouldAssignIncreasingSequences) {
    MemoryJournal journal;

    // When three events are appended
    auto first = journal.append(location_event("a"));
    auto second = journal.append(location_event("b"));
    auto third = journal.append(location_event("c"));

    // Then sequences start at 1 and increase by one
    EXPECT_EQ(first.sequence(), 1u);
    EXPECT_EQ(second.sequence(), 2u);
    EXPECT_EQ(third.sequence(), 3u);
    EXPECT_EQ(journal.last_sequence(), 3u);
}

TEST(MemoryJournalTest, ReadAll_ShouldReturnEventsPackedWithTypeUrl) {
    MemoryJournal journal;
    journal.append(location_event("assembly"));

    auto entries = journal.read_all();

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(helpers::holds<events::LocationRegistered>(entries[0].event()));
    events::LocationRegistered event;
    ASSERT_TRUE(entries[0].event().UnpackTo(&event));
    EXPECT_EQ(event.location().code(), "assembly");
}

TEST(MemoryJournalTest, Empty_ShouldReportSequenceZero) {
    MemoryJournal journal;
    EXPECT_EQ(journal.last_sequence(), 0u);
    EXPECT_TRUE(journal.read_all().empty());
}

// =============================================================================
// FileJournal Tests
// =============================================================================

class FileJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = std::filesystem::temp_directory_path() / ("floorstock_journal_" + std::to_string(stamp));
        std::filesystem::create_directories(dir_);
        path_ = (dir_ / "journal.bin").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::string path_;
};

TEST_F(FileJournalTest, Reopen_ShouldReadBackEveryEntry) {
    {
        FileJournal journal(path_);
        journal.append(location_event("polish"));
        journal.append(location_event("shipping"));
    }

    // When the journal is opened again
    FileJournal reopened(path_);
    auto entries = reopened.read_all();

    // Then both entries are there and sequencing continues
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].sequence(), 2u);
    EXPECT_EQ(reopened.last_sequence(), 2u);
    EXPECT_EQ(reopened.append(location_event("storage")).sequence(), 3u);
}

TEST_F(FileJournalTest, TornTail_ShouldBeDroppedOnOpen) {
    {
        FileJournal journal(path_);
        journal.append(location_event("polish"));
        journal.append(location_event("finishing"));
    }
    auto intact_size = std::filesystem::file_size(path_);

    // Given an interrupted append left a partial record at the end
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        const char partial[] = {0x40, 0x08, 0x03};
        out.write(partial, sizeof(partial));
    }

    // When the journal is opened
    FileJournal reopened(path_);

    // Then the intact entries survive and the torn bytes are cut off
    EXPECT_EQ(reopened.read_all().size(), 2u);
    EXPECT_EQ(std::filesystem::file_size(path_), intact_size);

    // And the next append lands on a record boundary
    reopened.append(location_event("assembly"));
    FileJournal again(path_);
    auto entries = again.read_all();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].sequence(), 3u);
}

TEST_F(FileJournalTest, MissingFile_ShouldStartEmpty) {
    FileJournal journal(path_);
    EXPECT_EQ(journal.last_sequence(), 0u);
    EXPECT_TRUE(journal.read_all().empty());
}

TEST_F(FileJournalTest, UnwritableDirectory_ShouldThrowStorageFailure) {
    auto path = (dir_ / "missing" / "journal.bin").string();
    try {
        FileJournal journal(path);
        FAIL() << "Expected StorageFailure";
    } catch (const InventoryError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageFailure);
        EXPECT_TRUE(e.is_defect());
    }
}
