#ifndef JSXFER_BROKER_JETSTREAM_HPP
#define JSXFER_BROKER_JETSTREAM_HPP

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nats/nats.h>
#include "broker/broker.hpp"
#include "broker/nats_connection.hpp"

namespace jsxfer {
namespace broker {

struct JetStreamOptions {
  // Applies to stream and consumer management requests
  std::chrono::milliseconds request_timeout{5000};
  // How long a published chunk may wait for its acknowledgement
  std::chrono::milliseconds publish_timeout{5000};
  // nats.c stalls js_PublishMsgAsync beyond this many outstanding acks
  int max_pending{256};
};

// Synchronous push consumer created by js_SubscribeSync. nats.c answers
// flow control requests and stalled heartbeats as messages are consumed.
class JetStreamSubscription : public Subscription {
public:
  JetStreamSubscription(const JetStreamSubscription&) = delete;
  JetStreamSubscription& operator=(const JetStreamSubscription&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Takes ownership of the subscription
  explicit JetStreamSubscription(natsSubscription* subscription);
  ~JetStreamSubscription() override;


  // ---- SUBSCRIPTION INTERFACE ----
  // Throws BrokerError(TIMEOUT), or INVALID_MESSAGE when the metadata cannot be parsed
  Message next_message(std::chrono::milliseconds timeout) override;
  // Also deletes the ephemeral consumer
  void unsubscribe() override;

private:
  natsSubscription* subscription_;
  bool unsubscribed_{false};
};

class JetStream : public Broker {
public:
  JetStream(const JetStream&) = delete;
  JetStream& operator=(const JetStream&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws BrokerError if the JetStream context cannot be created
  explicit JetStream(NatsConnection& connection, JetStreamOptions options = {});
  // Waits up to publish_timeout for outstanding acknowledgements
  ~JetStream() override;


  // ---- BROKER INTERFACE ----
  StreamInfo stream_info(const std::string& name) override;
  StreamInfo create_stream(const StreamConfig& config) override;
  std::future<PubAck> publish_async(const std::string& subject, std::vector<char> payload) override;
  std::unique_ptr<Subscription> subscribe(const std::string& subject, const SubscribeOptions& options) override;
  std::string new_inbox() override;


  // ---- STREAM REMOVAL ----
  // Throws BrokerError(STREAM_NOT_FOUND)
  void delete_stream(const std::string& name);

private:
  // ---- PARAMETERS ----
  NatsConnection& connection_;
  JetStreamOptions options_;
  jsCtx* context_{nullptr};

  // Acknowledgement promises keyed by the message handed to nats.c
  std::mutex pending_mutex_;
  std::map<natsMsg*, std::promise<PubAck>> pending_;


  // ---- ACKNOWLEDGEMENTS ----
  // Runs on nats.c's ack thread; owns and destroys msg
  static void on_publish_ack(jsCtx* js, natsMsg* msg, jsPubAck* ack, jsPubAckErr* error, void* closure);
  void complete(natsMsg* msg, const jsPubAck* ack, const jsPubAckErr* error);
  // Fails every unacknowledged publish, e.g. when shutting down
  void abandon_pending(const std::string& reason);
};

} // namespace broker
} // namespace jsxfer

#endif // JSXFER_BROKER_JETSTREAM_HPP
