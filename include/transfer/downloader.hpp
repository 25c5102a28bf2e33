#ifndef JSXFER_TRANSFER_DOWNLOADER_HPP
#define JSXFER_TRANSFER_DOWNLOADER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "broker/broker.hpp"
#include "transfer/chunk_io.hpp"
#include "transfer/transfer_stats.hpp"

namespace jsxfer {
namespace transfer {

struct DownloadOptions {
  std::filesystem::path destination_dir{"."};
  // Tolerates consumer startup latency
  std::chrono::milliseconds first_timeout{5000};
  // Detects stalled or broken streams once data is flowing
  std::chrono::milliseconds next_timeout{1000};
};

class Downloader {
public:
  /**
   * Consumer states while retrieving a stream:
   * SUBSCRIBED    - receiving from a consumer started at some sequence
   * GAP_DETECTED  - a delivered sequence did not match the expected one
   * RESUBSCRIBING - the old consumer is dropped, a new one starts at the expected sequence
   */
  enum class State {
    SUBSCRIBED,
    GAP_DETECTED,
    RESUBSCRIBING
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Downloader(broker::Broker& broker, DownloadOptions options = {});


  // ---- DOWNLOAD ----
  // Retrieves the stream named after `name` into destination_dir/<stream>.
  // Refuses to overwrite an existing file.
  TransferStats download(const std::string& name);

private:
  // Progress counters outlive any single subscription
  struct Session {
    std::string subject;
    std::uint64_t expected_sequence{1};
    // Message count captured at start; not refreshed mid-transfer
    std::uint64_t last_sequence{0};
    State state{State::SUBSCRIBED};
    std::unique_ptr<broker::Subscription> subscription;
  };

  // ---- PARAMETERS ----
  broker::Broker& broker_;
  DownloadOptions options_;


  // ---- STREAM LOOKUP ----
  broker::StreamInfo lookup_stream(const std::string& stream);


  // ---- CONSUMPTION ----
  // Drops the current consumer (if any) and starts a new one at the expected sequence
  void subscribe_at_expected(Session& session);
  // Receives messages until expected_sequence passes last_sequence
  void consume(Session& session, ChunkSink& sink, TransferStats& stats);
  broker::Message receive(Session& session, std::chrono::milliseconds timeout);
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_DOWNLOADER_HPP
