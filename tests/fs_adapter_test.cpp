#include <gtest/gtest.h>

#include "adapters/fs.hpp"
#include "test_utils.hpp"

using namespace fsort::adapters;
using fsort::test::TempDir;
using fsort::test::read_file;
using fsort::test::write_file;
namespace stdfs = std::filesystem;

TEST(FsAdapterTest, RenameNoReplaceMovesFile)
{
    TempDir tmp;
    write_file(tmp / "a.txt", "alpha");
    EXPECT_FALSE(fs::rename_no_replace(tmp / "a.txt", tmp / "b.txt"));
    EXPECT_FALSE(stdfs::exists(tmp / "a.txt"));
    EXPECT_EQ(read_file(tmp / "b.txt"), "alpha");
}

TEST(FsAdapterTest, RenameNoReplaceRefusesExistingDestination)
{
    TempDir tmp;
    write_file(tmp / "a.txt", "alpha");
    write_file(tmp / "b.txt", "beta");
    auto ec = fs::rename_no_replace(tmp / "a.txt", tmp / "b.txt");
    EXPECT_EQ(ec, std::errc::file_exists);
    EXPECT_EQ(read_file(tmp / "a.txt"), "alpha");
    EXPECT_EQ(read_file(tmp / "b.txt"), "beta");
}

TEST(FsAdapterTest, MoveFileReportsMissingSource)
{
    TempDir tmp;
    auto res = fs::move_file(tmp / "missing.txt", tmp / "dst.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, fsort::infra::ErrorCode::NotFound);
}

TEST(FsAdapterTest, MoveFileSameFilesystemUsesRename)
{
    TempDir tmp;
    write_file(tmp / "a.txt", "alpha");
    auto res = fs::move_file(tmp / "a.txt", tmp / "b.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->method, fs::MoveMethod::Rename);
    EXPECT_TRUE(res->source_removed);
    EXPECT_EQ(read_file(tmp / "b.txt"), "alpha");
}

TEST(FsAdapterTest, CopyExclusiveCopiesContent)
{
    TempDir tmp;
    std::string big(300 * 1024, 'x');   // больше одного буфера
    big[12345] = 'y';
    write_file(tmp / "src.bin", big);
    ASSERT_TRUE(fs::copy_file_exclusive(tmp / "src.bin", tmp / "dst.bin").has_value());
    EXPECT_EQ(read_file(tmp / "dst.bin"), big);
    EXPECT_TRUE(stdfs::exists(tmp / "src.bin"));
}

TEST(FsAdapterTest, CopyExclusiveRefusesExistingDestination)
{
    TempDir tmp;
    write_file(tmp / "src.txt", "new");
    write_file(tmp / "dst.txt", "old");
    auto res = fs::copy_file_exclusive(tmp / "src.txt", tmp / "dst.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, fsort::infra::ErrorCode::AlreadyExists);
    EXPECT_EQ(read_file(tmp / "dst.txt"), "old");
}

TEST(FsAdapterTest, PathOccupied)
{
    TempDir tmp;
    write_file(tmp / "file.txt");
    EXPECT_TRUE(fs::path_occupied(tmp / "file.txt").value());
    EXPECT_FALSE(fs::path_occupied(tmp / "nothing.txt").value());
#ifndef _WIN32
    stdfs::create_symlink(tmp / "nowhere", tmp / "dangling");
    EXPECT_TRUE(fs::path_occupied(tmp / "dangling").value());
#endif
}

TEST(FsAdapterTest, DotFilesAreHidden)
{
    TempDir tmp;
    write_file(tmp / ".secret");
    write_file(tmp / "visible.txt");
    EXPECT_TRUE(fs::is_hidden(tmp / ".secret").value());
    EXPECT_FALSE(fs::is_hidden(tmp / "visible.txt").value());
}

TEST(FsAdapterTest, HiddenQueryFailsForMissingFile)
{
    TempDir tmp;
    EXPECT_FALSE(fs::is_hidden(tmp / "missing.txt").has_value());
}

TEST(FsAdapterTest, CopyThenRemoveWithVerification)
{
    TempDir tmp;
    std::string payload(200 * 1024, 'a');
    payload[4096] = 'b';
    write_file(tmp / "in" / "song.mp3", payload);
    stdfs::create_directory(tmp / "out");

    auto res = fs::copy_then_remove(tmp / "in" / "song.mp3", tmp / "out" / "song.mp3",
                                    fs::MoveOptions{.verify = true});

    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res->method, fs::MoveMethod::CopyDelete);
    EXPECT_TRUE(res->source_removed);
    EXPECT_FALSE(stdfs::exists(tmp / "in" / "song.mp3"));
    EXPECT_EQ(read_file(tmp / "out" / "song.mp3"), payload);
}

TEST(FsAdapterTest, CopyThenRemoveDiscardsUnverifiedCopy)
{
    TempDir tmp;
    write_file(tmp / "in" / "doc.pdf", "original");
    stdfs::create_directory(tmp / "out");

    int calls = 0;
    fs::MoveOptions options{.verify = true};
    options.verifier = [&calls](const stdfs::path& original, const stdfs::path&) -> fsort::infra::VoidResult {
        ++calls;
        return std::unexpected(fsort::infra::make_error(fsort::infra::ErrorCode::IoError,
            "Copy of " + original.string() + " does not match the original"));
    };

    auto res = fs::copy_then_remove(tmp / "in" / "doc.pdf", tmp / "out" / "doc.pdf", options);

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(res.error().code, fsort::infra::ErrorCode::IoError);
    EXPECT_FALSE(stdfs::exists(tmp / "out" / "doc.pdf"));
    EXPECT_EQ(read_file(tmp / "in" / "doc.pdf"), "original");
}

TEST(FsAdapterTest, CopyThenRemoveSkipsVerifierWhenDisabled)
{
    TempDir tmp;
    write_file(tmp / "a.txt", "alpha");

    fs::MoveOptions options;
    options.verifier = [](const stdfs::path&, const stdfs::path&) -> fsort::infra::VoidResult {
        return std::unexpected(fsort::infra::make_error(fsort::infra::ErrorCode::IoError, "unexpected"));
    };

    auto res = fs::copy_then_remove(tmp / "a.txt", tmp / "b.txt", options);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(read_file(tmp / "b.txt"), "alpha");
}

TEST(FsAdapterTest, CopyThenRemoveKeepsCopyWhenSourceCannotBeRemoved)
{
    if (fsort::test::running_as_root()) {
        GTEST_SKIP() << "permission bits do not apply to root";
    }
    TempDir tmp;
    write_file(tmp / "locked" / "photo.jpg", "pixels");
    stdfs::create_directory(tmp / "out");
    // Чтение разрешено, удаление из каталога нет
    stdfs::permissions(tmp / "locked", stdfs::perms::owner_read | stdfs::perms::owner_exec);

    auto res = fs::copy_then_remove(tmp / "locked" / "photo.jpg", tmp / "out" / "photo.jpg",
                                    fs::MoveOptions{.verify = true});

    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_FALSE(res->source_removed);
    EXPECT_FALSE(res->cleanup_error.empty());
    EXPECT_EQ(read_file(tmp / "out" / "photo.jpg"), "pixels");
    EXPECT_TRUE(stdfs::exists(tmp / "locked" / "photo.jpg"));
}

TEST(FsAdapterTest, CopyThenRemoveRefusesOccupiedDestination)
{
    TempDir tmp;
    write_file(tmp / "new.txt", "new");
    write_file(tmp / "old.txt", "old");

    auto res = fs::copy_then_remove(tmp / "new.txt", tmp / "old.txt");

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, fsort::infra::ErrorCode::AlreadyExists);
    EXPECT_EQ(read_file(tmp / "old.txt"), "old");
    EXPECT_EQ(read_file(tmp / "new.txt"), "new");
}

TEST(FsAdapterTest, MoveAcrossFilesystemsFallsBackToCopy)
{
    const stdfs::path shm = "/dev/shm";
    if (!stdfs::is_directory(shm) ||
        !fsort::test::on_different_devices(shm, stdfs::temp_directory_path())) {
        GTEST_SKIP() << "no second filesystem available";
    }
    TempDir source_fs(shm);
    TempDir target_fs;
    write_file(source_fs / "clip.mp4", "frames");

    auto res = fs::move_file(source_fs / "clip.mp4", target_fs / "clip.mp4",
                             fs::MoveOptions{.verify = true});

    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res->method, fs::MoveMethod::CopyDelete);
    EXPECT_TRUE(res->source_removed);
    EXPECT_FALSE(stdfs::exists(source_fs / "clip.mp4"));
    EXPECT_EQ(read_file(target_fs / "clip.mp4"), "frames");
}
