#ifndef JSXFER_TRANSFER_UPLOADER_HPP
#define JSXFER_TRANSFER_UPLOADER_HPP

#include <cstddef>
#include <string>
#include "broker/broker.hpp"
#include "transfer/chunk_io.hpp"
#include "transfer/publish_window.hpp"
#include "transfer/transfer_stats.hpp"

namespace jsxfer {
namespace transfer {

struct UploadOptions {
  std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
  std::size_t max_in_flight{DEFAULT_MAX_IN_FLIGHT};
  int num_replicas{1};
};

class Uploader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Uploader(broker::Broker& broker, UploadOptions options = {});


  // ---- UPLOAD ----
  // Places the file into a freshly created stream named after it.
  // Write-once: fails with STREAM_EXISTS if the stream is already there.
  TransferStats upload(const std::string& file_path);

private:
  // ---- PARAMETERS ----
  broker::Broker& broker_;
  UploadOptions options_;


  // ---- STREAM PROVISIONING ----
  // Verifies the name is free, then creates the stream bound to a new inbox subject
  std::string provision_stream(const std::string& stream);
  // Pushes every chunk through the publish window
  void publish_chunks(ChunkSource& source, const std::string& subject, TransferStats& stats);
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_UPLOADER_HPP
