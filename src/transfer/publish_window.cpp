#include "transfer/publish_window.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>

namespace jsxfer {
namespace transfer {

PublishWindow::PublishWindow(std::size_t max_in_flight) : max_in_flight_(max_in_flight) {
  if (max_in_flight_ == 0) {
    throw std::invalid_argument("Publish window: window size must be > 0");
  }
}

void PublishWindow::reserve() {
  if (failed_) {
    throw TransferError(TransferErrorCode::PUBLISH_FAILED, "publish window already failed");
  }

  // Surface asynchronous failures as early as possible
  harvest();
  while (pending_.size() >= max_in_flight_) {
    complete_oldest();
  }
}

void PublishWindow::push(std::future<broker::PubAck> ack) {
  if (pending_.size() >= max_in_flight_) {
    throw std::logic_error("Publish window: push without a reserved slot");
  }
  pending_.push_back(std::move(ack));
  if (pending_.size() > high_water_mark_) {
    high_water_mark_ = pending_.size();
  }
}

void PublishWindow::drain() {
  BOOST_LOG_TRIVIAL(debug) << "Publish window: Draining " << pending_.size() << " outstanding publishes";
  while (!pending_.empty()) {
    complete_oldest();
  }
}

void PublishWindow::harvest() {
  while (!pending_.empty() &&
         pending_.front().wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    complete_oldest();
  }
}

void PublishWindow::complete_oldest() {
  std::future<broker::PubAck> ack = std::move(pending_.front());
  pending_.pop_front();
  settle(ack);
}

void PublishWindow::settle(std::future<broker::PubAck>& ack) {
  try {
    broker::PubAck result = ack.get();
    ++acknowledged_;
    last_sequence_ = result.sequence;
    BOOST_LOG_TRIVIAL(trace) << "Publish window: Acknowledged sequence " << result.sequence;
  }
  catch (const std::exception& e) {
    failed_ = true;
    // Outstanding acknowledgements are abandoned with the transfer
    pending_.clear();
    BOOST_LOG_TRIVIAL(error) << "Publish window: Error sending chunk to JetStream: " << e.what();
    throw TransferError(TransferErrorCode::PUBLISH_FAILED, e.what());
  }
}

} // namespace transfer
} // namespace jsxfer
