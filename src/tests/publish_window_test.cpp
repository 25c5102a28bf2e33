#include <gtest/gtest.h>
#include <future>
#include "transfer/publish_window.hpp"
#include "transfer/transfer_error.hpp"

using namespace jsxfer;
using transfer::PublishWindow;

namespace {

std::future<broker::PubAck> ready_ack(std::uint64_t sequence) {
    std::promise<broker::PubAck> promise;
    promise.set_value(broker::PubAck{"stream", sequence, false});
    return promise.get_future();
}

std::future<broker::PubAck> failed_ack() {
    std::promise<broker::PubAck> promise;
    promise.set_exception(std::make_exception_ptr(
        broker::BrokerError(broker::BrokerErrorCode::PUBLISH_FAILED, "insufficient resources")));
    return promise.get_future();
}

} // namespace

TEST(PublishWindowTest, RejectsZeroSize) {
    EXPECT_THROW(PublishWindow window(0), std::invalid_argument);
}

TEST(PublishWindowTest, TracksOutstandingPublishes) {
    PublishWindow window(4);
    std::vector<std::promise<broker::PubAck>> promises(3);

    for (auto& promise : promises) {
        window.reserve();
        window.push(promise.get_future());
    }
    EXPECT_EQ(window.in_flight(), 3u);
    EXPECT_EQ(window.high_water_mark(), 3u);

    for (std::size_t i = 0; i < promises.size(); ++i) {
        promises[i].set_value(broker::PubAck{"stream", i + 1, false});
    }
    window.drain();
    EXPECT_EQ(window.in_flight(), 0u);
    EXPECT_EQ(window.acknowledged(), 3u);
    EXPECT_EQ(window.last_sequence(), 3u);
}

TEST(PublishWindowTest, ReserveHarvestsCompletedAcks) {
    PublishWindow window(2);
    window.reserve();
    window.push(ready_ack(1));
    window.reserve();
    window.push(ready_ack(2));

    // Both are complete, so this does not block
    window.reserve();
    EXPECT_EQ(window.in_flight(), 0u);
    EXPECT_EQ(window.acknowledged(), 2u);
}

TEST(PublishWindowTest, NeverExceedsMaximum) {
    PublishWindow window(3);
    for (std::uint64_t i = 1; i <= 20; ++i) {
        window.reserve();
        window.push(std::async(std::launch::deferred, [i] { return broker::PubAck{"stream", i, false}; }));
        EXPECT_LE(window.in_flight(), 3u);
    }
    window.drain();
    EXPECT_EQ(window.high_water_mark(), 3u);
    EXPECT_EQ(window.acknowledged(), 20u);
}

TEST(PublishWindowTest, PushWithoutReserveWhenFullThrows) {
    PublishWindow window(1);
    std::promise<broker::PubAck> pending;
    window.reserve();
    window.push(pending.get_future());
    EXPECT_THROW(window.push(ready_ack(2)), std::logic_error);
    pending.set_value(broker::PubAck{"stream", 1, false});
}

TEST(PublishWindowTest, FailedAckSurfacesOnDrain) {
    PublishWindow window(4);
    window.reserve();
    window.push(ready_ack(1));
    window.reserve();
    window.push(failed_ack());

    try {
        window.drain();
        FAIL() << "Drain should rethrow the failed acknowledgement";
    } catch (const transfer::TransferError& e) {
        EXPECT_EQ(e.code(), transfer::TransferErrorCode::PUBLISH_FAILED);
    }
}

TEST(PublishWindowTest, FailurePoisonsWindow) {
    PublishWindow window(4);
    window.reserve();
    window.push(failed_ack());

    EXPECT_THROW(window.reserve(), transfer::TransferError);
    EXPECT_THROW(window.reserve(), transfer::TransferError);
    EXPECT_EQ(window.in_flight(), 0u);
}
