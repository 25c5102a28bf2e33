#ifndef JSXFER_BROKER_HPP
#define JSXFER_BROKER_HPP

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "broker/broker_error.hpp"

namespace jsxfer {
namespace broker {

struct StreamConfig {
  std::string name;
  std::vector<std::string> subjects;
  int num_replicas{1};
};

struct StreamState {
  std::uint64_t messages{0};
  std::uint64_t bytes{0};
  std::uint64_t first_seq{0};
  std::uint64_t last_seq{0};
};

struct StreamInfo {
  StreamConfig config;
  StreamState state;
};

// Broker acknowledgement of a persisted publish
struct PubAck {
  std::string stream;
  std::uint64_t sequence{0};
  bool duplicate{false};
};

// Delivery metadata of a stream message
struct MessageMetadata {
  std::string stream;
  std::string consumer;
  std::uint64_t num_delivered{0};
  std::uint64_t stream_sequence{0};
  std::uint64_t consumer_sequence{0};
  std::int64_t timestamp_ns{0};
  std::uint64_t num_pending{0};
};

struct Message {
  std::string subject;
  std::vector<char> payload;
  MessageMetadata metadata;
};

struct SubscribeOptions {
  std::uint64_t start_sequence{1};
  bool ack_none{true};
  int max_deliver{1};
  bool flow_control{true};
  std::chrono::milliseconds idle_heartbeat{5000};
};

class Subscription {
public:
  virtual ~Subscription() = default;

  // Blocks for the next stream message. Throws BrokerError(TIMEOUT).
  virtual Message next_message(std::chrono::milliseconds timeout) = 0;

  // Stops delivery; further calls are no-ops
  virtual void unsubscribe() = 0;
};

class Broker {
public:
  virtual ~Broker() = default;

  // ---- STREAM MANAGEMENT ----
  // Throws BrokerError(STREAM_NOT_FOUND) when no such stream exists
  virtual StreamInfo stream_info(const std::string& name) = 0;
  // Throws BrokerError(STREAM_EXISTS) when the name is already taken
  virtual StreamInfo create_stream(const StreamConfig& config) = 0;


  // ---- PUBLISHING ----
  // The future fails with BrokerError(PUBLISH_FAILED) if the broker rejects the message
  virtual std::future<PubAck> publish_async(const std::string& subject, std::vector<char> payload) = 0;


  // ---- CONSUMING ----
  virtual std::unique_ptr<Subscription> subscribe(const std::string& subject,
                                                  const SubscribeOptions& options) = 0;


  // ---- UTILITIES ----
  // Unique, unguessable subject name
  virtual std::string new_inbox() = 0;
};

} // namespace broker
} // namespace jsxfer

#endif // JSXFER_BROKER_HPP
