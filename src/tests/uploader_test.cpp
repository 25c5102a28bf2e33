#include <gtest/gtest.h>
#include <filesystem>
#include "fake_broker.hpp"
#include "test_utils.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/uploader.hpp"

using namespace jsxfer;
using transfer::TransferError;
using transfer::TransferErrorCode;
using transfer::Uploader;
using transfer::UploadOptions;

class UploaderTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    test::FakeBroker broker;

    void SetUp() override {
        test_dir = test::make_temp_dir("uploader_test");
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::filesystem::path make_file(const std::string& name, std::size_t size) {
        const auto path = test_dir / name;
        test::write_file(path, test::make_pattern(size));
        return path;
    }

    TransferErrorCode upload_error(const std::filesystem::path& path, UploadOptions options = {}) {
        try {
            Uploader(broker, options).upload(path.string());
        } catch (const TransferError& e) {
            return e.code();
        }
        return TransferErrorCode::SUCCESS;
    }
};

TEST_F(UploaderTest, CreatesStreamNamedAfterFile) {
    const auto path = make_file("report.v1.pdf", 100);

    const auto stats = Uploader(broker).upload(path.string());

    EXPECT_EQ(stats.stream, "report_v1_pdf");
    ASSERT_EQ(broker.streams.count("report_v1_pdf"), 1u);
    const auto& stream = broker.streams["report_v1_pdf"];
    ASSERT_EQ(stream.config.subjects.size(), 1u);
    EXPECT_EQ(stream.config.subjects.front().rfind("_INBOX.", 0), 0u);
}

TEST_F(UploaderTest, PublishesChunksInOrder) {
    const auto data = test::make_pattern(250);
    test::write_file(test_dir / "data.bin", data);
    UploadOptions options;
    options.chunk_size = 100;

    const auto stats = Uploader(broker, options).upload((test_dir / "data.bin").string());

    EXPECT_EQ(stats.bytes, 250u);
    EXPECT_EQ(stats.chunks, 3u);
    const auto& messages = broker.streams["data_bin"].messages;
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0], std::vector<char>(data.begin(), data.begin() + 100));
    EXPECT_EQ(messages[1], std::vector<char>(data.begin() + 100, data.begin() + 200));
    EXPECT_EQ(messages[2], std::vector<char>(data.begin() + 200, data.end()));
}

TEST_F(UploaderTest, EmptyFileCreatesEmptyStream) {
    const auto path = make_file("empty.txt", 0);

    const auto stats = Uploader(broker).upload(path.string());

    EXPECT_EQ(stats.chunks, 0u);
    EXPECT_EQ(broker.publishes, 0u);
    ASSERT_EQ(broker.streams.count("empty_txt"), 1u);
    EXPECT_TRUE(broker.streams["empty_txt"].messages.empty());
}

TEST_F(UploaderTest, RefusesExistingStream) {
    const auto path = make_file("dup.bin", 10);
    broker.add_stream("dup_bin", "_INBOX.other", {{'x'}});

    EXPECT_EQ(upload_error(path), TransferErrorCode::STREAM_EXISTS);
    // The existing stream is untouched
    EXPECT_EQ(broker.streams["dup_bin"].messages.size(), 1u);
    EXPECT_EQ(broker.publishes, 0u);
}

TEST_F(UploaderTest, SecondUploadOfSameNameFails) {
    const auto path = make_file("twice.bin", 10);
    Uploader(broker).upload(path.string());

    EXPECT_EQ(upload_error(path), TransferErrorCode::STREAM_EXISTS);
}

TEST_F(UploaderTest, CreateRaceReportsStreamExists) {
    const auto path = make_file("race.bin", 10);
    broker.create_stream_failure = broker::BrokerErrorCode::STREAM_EXISTS;

    EXPECT_EQ(upload_error(path), TransferErrorCode::STREAM_EXISTS);
}

TEST_F(UploaderTest, MissingFileFailsBeforeBrokerCalls) {
    EXPECT_EQ(upload_error(test_dir / "missing.bin"), TransferErrorCode::FILE_OPEN_FAILED);
    EXPECT_EQ(broker.stream_info_calls, 0u);
    EXPECT_TRUE(broker.streams.empty());
}

TEST_F(UploaderTest, LookupFailureIsBrokerFailure) {
    const auto path = make_file("x.bin", 10);
    broker.stream_info_failure = broker::BrokerErrorCode::TIMEOUT;

    EXPECT_EQ(upload_error(path), TransferErrorCode::BROKER_FAILURE);
}

TEST_F(UploaderTest, InFlightWindowIsBounded) {
    const auto path = make_file("window.bin", 100 * 16);
    UploadOptions options;
    options.chunk_size = 16;
    options.max_in_flight = 8;

    Uploader(broker, options).upload(path.string());

    EXPECT_EQ(broker.publishes, 100u);
    EXPECT_EQ(broker.max_in_flight_seen, 8u);
    // Everything was acknowledged before upload returned
    EXPECT_EQ(broker.in_flight(), 0u);
}

TEST_F(UploaderTest, FailedAcknowledgementAbortsUpload) {
    const auto path = make_file("fail.bin", 20 * 16);
    UploadOptions options;
    options.chunk_size = 16;
    broker.fail_publish_at = 3;

    EXPECT_EQ(upload_error(path, options), TransferErrorCode::PUBLISH_FAILED);
    // The failure surfaces once the window fills, not after the whole file
    EXPECT_LT(broker.publishes, 20u);
}

TEST_F(UploaderTest, FailedAcknowledgementOfLastChunk) {
    const auto path = make_file("tail.bin", 3 * 16);
    UploadOptions options;
    options.chunk_size = 16;
    broker.fail_publish_at = 2;

    EXPECT_EQ(upload_error(path, options), TransferErrorCode::PUBLISH_FAILED);
}

TEST_F(UploaderTest, SynchronousPublishErrorIsPublishFailure) {
    const auto path = make_file("sync.bin", 4 * 16);
    UploadOptions options;
    options.chunk_size = 16;
    broker.fail_publish_at = 1;
    broker.fail_publish_synchronously = true;

    EXPECT_EQ(upload_error(path, options), TransferErrorCode::PUBLISH_FAILED);
}
