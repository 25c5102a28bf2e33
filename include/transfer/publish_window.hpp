#ifndef JSXFER_TRANSFER_PUBLISH_WINDOW_HPP
#define JSXFER_TRANSFER_PUBLISH_WINDOW_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include "broker/broker.hpp"

namespace jsxfer {
namespace transfer {

constexpr std::size_t DEFAULT_MAX_IN_FLIGHT = 8;

// Sliding window over asynchronous publishes. At most max_in_flight
// acknowledgements are outstanding; admitting one more blocks on the oldest.
// The first failed acknowledgement is rethrown as TransferError(PUBLISH_FAILED)
// and poisons the window.
class PublishWindow {
public:
  explicit PublishWindow(std::size_t max_in_flight = DEFAULT_MAX_IN_FLIGHT);

  // Blocks until a slot is free. Call before issuing the next publish.
  void reserve();
  // Tracks an issued publish. reserve() must have been called first.
  void push(std::future<broker::PubAck> ack);
  // Waits for every outstanding acknowledgement
  void drain();

  std::size_t in_flight() const { return pending_.size(); }
  std::size_t max_in_flight() const { return max_in_flight_; }
  std::size_t high_water_mark() const { return high_water_mark_; }
  std::uint64_t acknowledged() const { return acknowledged_; }
  std::uint64_t last_sequence() const { return last_sequence_; }

private:
  std::size_t max_in_flight_;
  std::deque<std::future<broker::PubAck>> pending_;
  std::size_t high_water_mark_{0};
  std::uint64_t acknowledged_{0};
  std::uint64_t last_sequence_{0};
  bool failed_{false};

  // Collects acknowledgements that are already available without blocking
  void harvest();
  // Blocks on the oldest outstanding acknowledgement
  void complete_oldest();
  void settle(std::future<broker::PubAck>& ack);
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_PUBLISH_WINDOW_HPP
