#include <gtest/gtest.h>

#include "../common/file_io.hpp"
#include "test_util.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#  include <unistd.h>
#  include <fcntl.h>
#endif

namespace fs = std::filesystem;

TEST(ByteSourceTest, ReadFullBatchesTrickleFromAPipe)
{
#ifndef _WIN32
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    const std::vector<u8> data = testutil::sequential_bytes(3000);
    std::thread writer([&]() {
        // One byte per write(): the reader sees many tiny reads
        for (u8 b : data) {
            ssize_t n = ::write(fds[1], &b, 1);
            if (n != 1) break;
        }
        ::close(fds[1]);
    });

    file_io::ByteSource src(fds[0], true, "pipe");
    std::vector<u8> got;
    std::vector<size_t> fills;
    u8 buf[1024];
    for (;;) {
        size_t n = src.read_full(buf, sizeof(buf));
        if (n == 0) break;
        fills.push_back(n);
        got.insert(got.end(), buf, buf + n);
    }
    writer.join();

    EXPECT_EQ(got, data);
    ASSERT_EQ(fills.size(), 3u);
    EXPECT_EQ(fills[0], 1024u);
    EXPECT_EQ(fills[1], 1024u);
    EXPECT_EQ(fills[2], 3000u - 2048u);
#else
    GTEST_SKIP() << "POSIX pipe semantics";
#endif
}

TEST(ByteSourceTest, OpenFileReadsAndCloses)
{
    testutil::TempDir dir("bytesource");
    std::string path = dir.file("input.bin");
    testutil::write_file(path, testutil::bytes("hello snapshot"));

    file_io::ByteSource src = file_io::ByteSource::open_file(path);
    EXPECT_FALSE(src.is_stdin());
    EXPECT_EQ(src.name(), path);

    char buf[64];
    size_t n = src.read_full(buf, sizeof(buf));
    EXPECT_EQ(std::string(buf, n), "hello snapshot");
    EXPECT_EQ(src.read_full(buf, sizeof(buf)), 0u);

    src.close();
    EXPECT_LT(src.fd(), 0);
    EXPECT_THROW(src.read_some(buf, 1), std::runtime_error);
}

TEST(ByteSourceTest, OpenMissingFileThrows)
{
    EXPECT_THROW(file_io::ByteSource::open_file("/nonexistent/snapcp/input.snap"),
                 std::runtime_error);
}

TEST(ByteSourceTest, StdinSourceIsNeverClosed)
{
#ifndef _WIN32
    {
        file_io::ByteSource src = file_io::ByteSource::from_stdin();
        EXPECT_TRUE(src.is_stdin());
    }
    EXPECT_NE(::fcntl(STDIN_FILENO, F_GETFD), -1);
#else
    GTEST_SKIP() << "POSIX fd check";
#endif
}

TEST(StagingFileTest, FinishKeepsFileDiscardRemovesIt)
{
    testutil::TempDir dir("staging");
    std::string path = dir.file("sub/restore-1.part");

    file_io::StagingFile f;
    f.create(path);
    f.append("abc", 3);
    f.append("defg", 4);
    EXPECT_EQ(f.size(), 7u);
    f.finish();
    EXPECT_FALSE(f.is_open());
    EXPECT_EQ(testutil::read_file(path), testutil::bytes("abcdefg"));

    f.discard();
    EXPECT_FALSE(fs::exists(path));
}

TEST(StagingFileTest, CreateIsExclusive)
{
    testutil::TempDir dir("staging_excl");
    std::string path = dir.file("restore-2.part");
    testutil::write_file(path, testutil::bytes("other session"));

    file_io::StagingFile f;
    EXPECT_THROW(f.create(path), std::runtime_error);
    EXPECT_EQ(testutil::read_file(path), testutil::bytes("other session"));
}

TEST(StagingFileTest, DestructorRemovesUnreleasedFile)
{
    testutil::TempDir dir("staging_dtor");
    std::string kept = dir.file("kept.part");
    std::string dropped = dir.file("dropped.part");
    {
        file_io::StagingFile a;
        a.create(kept);
        a.append("x", 1);
        a.finish();
        a.release();

        file_io::StagingFile b;
        b.create(dropped);
        b.append("y", 1);
    }
    EXPECT_TRUE(fs::exists(kept));
    EXPECT_FALSE(fs::exists(dropped));
}

TEST(AtomicReplaceTest, ReplacesExistingTarget)
{
    testutil::TempDir dir("replace");
    std::string src = dir.file("new.part");
    std::string dst = dir.file("state.snap");
    testutil::write_file(dst, testutil::bytes("old"));
    testutil::write_file(src, testutil::bytes("new"));

    file_io::atomic_replace(src, dst);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(testutil::read_file(dst), testutil::bytes("new"));
}

TEST(AtomicReplaceTest, MissingSourceLeavesTargetAlone)
{
    testutil::TempDir dir("replace_missing");
    std::string dst = dir.file("state.snap");
    testutil::write_file(dst, testutil::bytes("old"));

    EXPECT_THROW(file_io::atomic_replace(dir.file("absent.part"), dst), std::runtime_error);
    EXPECT_EQ(testutil::read_file(dst), testutil::bytes("old"));
}
