#ifndef JSXFER_BROKER_NATS_CONNECTION_HPP
#define JSXFER_BROKER_NATS_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <nats/nats.h>
#include "broker/broker_error.hpp"

namespace jsxfer {
namespace broker {

constexpr const char* DEFAULT_NATS_URL = NATS_DEFAULT_URL;

struct ConnectionOptions {
  // Comma separated server URLs
  std::string servers{DEFAULT_NATS_URL};
  std::string name{"NATS JetStream Transfer"};
  // Optional .creds file (user JWT and nkey seed)
  std::string creds_file;
  std::chrono::milliseconds reconnect_wait{1000};
  int max_reconnects{10};
  // Invoked once when the connection closes without close() being called
  std::function<void(const std::string&)> closed_handler;
};

// Splits "a, b,,c" into {"a", "b", "c"}
std::vector<std::string> split_server_list(const std::string& servers);

// Owns a nats.c connection and its options
class NatsConnection {
public:
  NatsConnection(const NatsConnection&) = delete;
  NatsConnection& operator=(const NatsConnection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit NatsConnection(ConnectionOptions options);
  ~NatsConnection();


  // ---- CONNECTION CONTROL ----
  // Throws BrokerError(CONNECTION_FAILED / AUTHORIZATION_FAILED / INVALID_CREDENTIALS)
  void connect();
  // Idempotent
  void close();


  // ---- GETTERS ----
  bool is_closed() const;
  std::string connected_url() const;
  std::string last_error() const;
  // Throws BrokerError(CONNECTION_CLOSED) before connect()
  natsConnection* handle() const;

private:
  // ---- PARAMETERS ----
  ConnectionOptions options_;
  natsOptions* nats_options_{nullptr};
  natsConnection* connection_{nullptr};
  std::atomic<bool> closing_{false};


  // ---- SETUP ----
  void configure();


  // ---- CONNECTION EVENTS ----
  // Run on nats.c's internal threads
  static void on_disconnected(natsConnection* nc, void* closure);
  static void on_reconnected(natsConnection* nc, void* closure);
  static void on_closed(natsConnection* nc, void* closure);
};

} // namespace broker
} // namespace jsxfer

#endif // JSXFER_BROKER_NATS_CONNECTION_HPP
