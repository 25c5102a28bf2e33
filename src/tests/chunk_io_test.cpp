#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "transfer/chunk_io.hpp"
#include "transfer/transfer_error.hpp"

using namespace jsxfer::transfer;
using jsxfer::test::make_pattern;
using jsxfer::test::make_temp_dir;
using jsxfer::test::read_file;
using jsxfer::test::write_file;

class ChunkIoTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = make_temp_dir("chunk_io_test");
        ASSERT_TRUE(std::filesystem::exists(test_dir));
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    // Reads the whole file and returns the size of every chunk
    std::vector<std::size_t> chunk_sizes(const std::filesystem::path& path, std::size_t chunk_size) {
        ChunkSource source(path, chunk_size);
        std::vector<std::size_t> sizes;
        std::vector<char> chunk;
        while (source.next(chunk)) {
            sizes.push_back(chunk.size());
        }
        return sizes;
    }
};

TEST_F(ChunkIoTest, SplitsIntoFixedSizeChunks) {
    const auto path = test_dir / "data.bin";
    write_file(path, make_pattern(10));

    EXPECT_EQ(chunk_sizes(path, 4), (std::vector<std::size_t>{4, 4, 2}));
    EXPECT_EQ(chunk_sizes(path, 5), (std::vector<std::size_t>{5, 5}));
    EXPECT_EQ(chunk_sizes(path, 64), (std::vector<std::size_t>{10}));
}

TEST_F(ChunkIoTest, EmptyFileHasNoChunks) {
    const auto path = test_dir / "empty.bin";
    write_file(path, {});

    EXPECT_TRUE(chunk_sizes(path, DEFAULT_CHUNK_SIZE).empty());
}

TEST_F(ChunkIoTest, DefaultChunkSize) {
    const auto path = test_dir / "large.bin";
    write_file(path, make_pattern(DEFAULT_CHUNK_SIZE * 2 + 1));

    EXPECT_EQ(chunk_sizes(path, DEFAULT_CHUNK_SIZE),
              (std::vector<std::size_t>{DEFAULT_CHUNK_SIZE, DEFAULT_CHUNK_SIZE, 1}));
}

TEST_F(ChunkIoTest, SourceTracksBytesRead) {
    const auto path = test_dir / "data.bin";
    write_file(path, make_pattern(100));

    ChunkSource source(path, 30);
    std::vector<char> chunk;
    while (source.next(chunk)) {
    }
    EXPECT_EQ(source.bytes_read(), 100u);
}

TEST_F(ChunkIoTest, MissingSourceFails) {
    try {
        ChunkSource source(test_dir / "missing.bin");
        FAIL() << "Opening a missing file should throw";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::FILE_OPEN_FAILED);
    }
}

TEST_F(ChunkIoTest, DirectorySourceFails) {
    EXPECT_THROW(ChunkSource source(test_dir), TransferError);
}

TEST_F(ChunkIoTest, SinkWritesAllBytes) {
    const auto path = test_dir / "out.bin";
    const auto data = make_pattern(1000);
    {
        ChunkSink sink(path);
        sink.write(data.data(), 600);
        sink.write(data.data() + 600, 400);
        EXPECT_EQ(sink.bytes_written(), 1000u);
        sink.close();
    }
    EXPECT_EQ(read_file(path), data);
}

TEST_F(ChunkIoTest, SinkRefusesExistingFile) {
    const auto path = test_dir / "taken.bin";
    write_file(path, make_pattern(3));

    try {
        ChunkSink sink(path);
        FAIL() << "Existing destination should throw";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::DESTINATION_EXISTS);
    }
    // Existing content is untouched
    EXPECT_EQ(read_file(path), make_pattern(3));
}

TEST_F(ChunkIoTest, SinkRefusesDanglingSymlink) {
    const auto link = test_dir / "link.bin";
    const auto target = test_dir / "target.bin";
    std::filesystem::create_symlink(target, link);

    try {
        ChunkSink sink(link);
        FAIL() << "Symlinked destination should throw";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::DESTINATION_EXISTS);
    }
    // Nothing was created through the link
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(ChunkIoTest, SinkFailsInMissingDirectory) {
    try {
        ChunkSink sink(test_dir / "no" / "such" / "dir.bin");
        FAIL() << "Creating in a missing directory should throw";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), TransferErrorCode::FILE_OPEN_FAILED);
    }
}
