#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include "core/organizer/organizer.hpp"
#include "infra/interrupt.hpp"
#include "test_utils.hpp"

using namespace fsort::core;
using fsort::infra::ErrorCode;
using fsort::test::TempDir;
using fsort::test::read_file;
using fsort::test::write_file;
namespace fs = std::filesystem;

namespace {

class OrganizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fsort::infra::clear_interrupted();
        config_.threads = 4;
    }
    void TearDown() override {
        fsort::infra::clear_interrupted();
    }

    fsort::infra::Config config_;
    fsort::infra::ProgressMonitor monitor_{false};
    TempDir tmp_;
};

} // namespace

TEST_F(OrganizerTest, OrganizesMixedDirectory)
{
    write_file(tmp_ / "report.pdf", "report");
    write_file(tmp_ / "photo.jpg", "photo");
    write_file(tmp_ / "notes.txt", "new notes");
    write_file(tmp_ / "Documents" / "notes.txt", "old notes");

    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->submitted, 3u);
    EXPECT_EQ(result->moved, 3u);
    EXPECT_EQ(result->failed, 0u);
    EXPECT_FALSE(result->timed_out);

    EXPECT_EQ(read_file(tmp_ / "Documents" / "report.pdf"), "report");
    EXPECT_EQ(read_file(tmp_ / "Documents" / "notes.txt"), "old notes");
    EXPECT_EQ(read_file(tmp_ / "Documents" / "notes_1.txt"), "new notes");
    EXPECT_EQ(read_file(tmp_ / "Images" / "photo.jpg"), "photo");
    EXPECT_FALSE(fs::exists(tmp_ / "report.pdf"));
    EXPECT_FALSE(fs::exists(tmp_ / "photo.jpg"));
    EXPECT_FALSE(fs::exists(tmp_ / "notes.txt"));
}

TEST_F(OrganizerTest, EmptyDirectoryProcessesNothing)
{
    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->submitted, 0u);
    EXPECT_EQ(result->completed(), 0u);
    EXPECT_EQ(fsort::test::count_entries(tmp_.path()), 0u);
}

TEST_F(OrganizerTest, SecondRunIsNoOp)
{
    write_file(tmp_ / "a.pdf");
    write_file(tmp_ / "b.mp3");

    Organizer organizer(config_, monitor_);
    auto first = organizer.run(tmp_.path());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->moved, 2u);

    auto second = organizer.run(tmp_.path());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->submitted, 0u);
    EXPECT_EQ(second->failed, 0u);
    EXPECT_TRUE(fs::exists(tmp_ / "Documents" / "a.pdf"));
    EXPECT_TRUE(fs::exists(tmp_ / "Audio" / "b.mp3"));
}

TEST_F(OrganizerTest, LeavesHiddenFilesAndDirectoriesAlone)
{
    write_file(tmp_ / ".hidden.pdf");
    write_file(tmp_ / "nested" / "inner.pdf");
    write_file(tmp_ / "visible.pdf");

    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->submitted, 1u);
    EXPECT_TRUE(fs::exists(tmp_ / ".hidden.pdf"));
    EXPECT_TRUE(fs::exists(tmp_ / "nested" / "inner.pdf"));
    EXPECT_TRUE(fs::exists(tmp_ / "Documents" / "visible.pdf"));
}

TEST_F(OrganizerTest, MissingSourceIsRejected)
{
    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_ / "does-not-exist");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidSourceDirectory);
    EXPECT_TRUE(result.error().is_fatal());
}

TEST_F(OrganizerTest, FileAsSourceIsRejected)
{
    write_file(tmp_ / "plain.txt");
    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_ / "plain.txt");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidSourceDirectory);
    EXPECT_TRUE(fs::exists(tmp_ / "plain.txt"));
}

TEST_F(OrganizerTest, PermissionFailureIsIsolated)
{
    if (fsort::test::running_as_root()) {
        GTEST_SKIP() << "permission bits do not apply to root";
    }
    fs::create_directory(tmp_ / "Images");
    fs::permissions(tmp_ / "Images", fs::perms::owner_read | fs::perms::owner_exec);
    write_file(tmp_ / "photo.jpg");
    write_file(tmp_ / "report.pdf");
    write_file(tmp_ / "song.mp3");

    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->submitted, 3u);
    EXPECT_EQ(result->moved, 2u);
    EXPECT_EQ(result->failed, 1u);
    ASSERT_EQ(result->failures.size(), 1u);
    EXPECT_EQ(result->failures.front().kind(), ErrorCode::PermissionDenied);
    EXPECT_EQ(result->failures.front().source, tmp_ / "photo.jpg");
    EXPECT_TRUE(fs::exists(tmp_ / "Documents" / "report.pdf"));
    EXPECT_TRUE(fs::exists(tmp_ / "Audio" / "song.mp3"));
}

TEST_F(OrganizerTest, ManyFilesWithOneWorkerPerCategory)
{
    config_.threads = 8;
    for (int i = 0; i < 200; ++i) {
        write_file(tmp_ / ("doc" + std::to_string(i) + ".pdf"));
        write_file(tmp_ / ("img" + std::to_string(i) + ".png"));
    }

    Organizer organizer(config_, monitor_);
    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->moved, 400u);
    EXPECT_EQ(fsort::test::count_entries(tmp_ / "Documents"), 200u);
    EXPECT_EQ(fsort::test::count_entries(tmp_ / "Images"), 200u);
    EXPECT_EQ(fsort::test::count_entries(tmp_.path()), 2u);
}

TEST_F(OrganizerTest, DeadlineCancelsPendingItems)
{
    config_.threads = 1;
    for (int i = 0; i < 5; ++i) {
        write_file(tmp_ / ("slow" + std::to_string(i) + ".txt"));
    }

    Organizer organizer(config_, monitor_);
    organizer.set_drain_timeout(std::chrono::milliseconds(50));
    organizer.set_item_handler([](const WorkItem& item) -> Outcome {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return Moved{item.source_path, item.source_path};
    });

    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timed_out);
    EXPECT_EQ(result->submitted, 5u);
    EXPECT_EQ(result->completed(), 5u);
    EXPECT_LE(result->moved, 1u);
    EXPECT_GE(result->skipped, 4u);
}

TEST_F(OrganizerTest, InterruptReportsScanInterrupted)
{
    config_.threads = 1;
    write_file(tmp_ / "a.txt");
    write_file(tmp_ / "b.txt");
    write_file(tmp_ / "c.txt");

    Organizer organizer(config_, monitor_);
    organizer.set_item_handler([](const WorkItem& item) -> Outcome {
        fsort::infra::g_interrupted.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return Moved{item.source_path, item.source_path};
    });

    auto result = organizer.run(tmp_.path());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(result.error().to_exit_code(), 130);
}

TEST_F(OrganizerTest, SignalAfterAllWorkFinishedIsIgnored)
{
    write_file(tmp_ / "only.pdf");

    Organizer organizer(config_, monitor_);
    organizer.set_item_handler([](const WorkItem& item) -> Outcome {
        // Последний элемент уже готов, прерывать нечего
        fsort::infra::g_interrupted.store(true);
        return Moved{item.source_path, item.source_path};
    });

    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->submitted, 1u);
    EXPECT_EQ(result->moved, 1u);
    EXPECT_FALSE(result->timed_out);
}

TEST_F(OrganizerTest, HandlerExceptionBecomesFailure)
{
    write_file(tmp_ / "boom.txt");
    write_file(tmp_ / "fine.txt");

    Organizer organizer(config_, monitor_);
    organizer.set_item_handler([](const WorkItem& item) -> Outcome {
        if (item.source_path.filename() == "boom.txt") {
            throw std::runtime_error("boom");
        }
        return Moved{item.source_path, item.source_path};
    });

    auto result = organizer.run(tmp_.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->moved, 1u);
    EXPECT_EQ(result->failed, 1u);
    ASSERT_EQ(result->failures.size(), 1u);
    EXPECT_EQ(result->failures.front().kind(), ErrorCode::IoError);
}

TEST_F(OrganizerTest, ProgressMonitorSeesEveryOutcome)
{
    write_file(tmp_ / "one.pdf");
    write_file(tmp_ / "two.jpg");

    Organizer organizer(config_, monitor_);
    ASSERT_TRUE(organizer.run(tmp_.path()).has_value());

    auto stats = monitor_.get_stats();
    EXPECT_EQ(stats.total_files, 2u);
    EXPECT_EQ(stats.moved_files, 2u);
    EXPECT_EQ(stats.finished_files(), 2u);
}
