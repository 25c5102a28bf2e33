#include "transfer/uploader.hpp"
#include "transfer/naming.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>
#include <vector>

namespace jsxfer {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Uploader::Uploader(broker::Broker& broker, UploadOptions options)
  : broker_(broker)
  , options_(options) {}

//==============================================
// UPLOAD
//==============================================

TransferStats Uploader::upload(const std::string& file_path) {
  // Make sure we have a legitimate file before touching the broker
  ChunkSource source(file_path, options_.chunk_size);

  const std::string stream = canonical_name(file_path);
  if (!names_a_file(file_path) || !is_valid_name(stream)) {
    throw TransferError(TransferErrorCode::INVALID_NAME, "cannot derive a stream name from \"" + file_path + "\"");
  }
  BOOST_LOG_TRIVIAL(info) << "Uploader: Uploading " << file_path << " as stream " << stream;

  const std::string subject = provision_stream(stream);

  TransferStats stats;
  stats.stream = stream;
  const auto start = std::chrono::steady_clock::now();
  publish_chunks(source, subject, stats);
  stats.elapsed = std::chrono::steady_clock::now() - start;

  BOOST_LOG_TRIVIAL(debug) << "Uploader: Published " << stats.chunks << " chunks (" << stats.bytes
                           << " bytes) to stream " << stream;
  return stats;
}

//==============================================
// STREAM PROVISIONING
//==============================================

std::string Uploader::provision_stream(const std::string& stream) {
  try {
    broker_.stream_info(stream);
    BOOST_LOG_TRIVIAL(error) << "Uploader: Stream " << stream << " already exists";
    throw TransferError(TransferErrorCode::STREAM_EXISTS, "Stream \"" + stream + "\" already exists");
  }
  catch (const broker::BrokerError& e) {
    if (e.code() != broker::BrokerErrorCode::STREAM_NOT_FOUND) {
      throw TransferError(TransferErrorCode::BROKER_FAILURE, e.what());
    }
  }

  // Delivery subject as an inbox to avoid interfering with other subjects
  const std::string subject = broker_.new_inbox();

  broker::StreamConfig config;
  config.name = stream;
  config.subjects = {subject};
  config.num_replicas = options_.num_replicas;

  try {
    broker_.create_stream(config);
  }
  catch (const broker::BrokerError& e) {
    if (e.code() == broker::BrokerErrorCode::STREAM_EXISTS) {
      throw TransferError(TransferErrorCode::STREAM_EXISTS, "Stream \"" + stream + "\" already exists");
    }
    BOOST_LOG_TRIVIAL(error) << "Uploader: Unexpected error creating stream: " << e.what();
    throw TransferError(TransferErrorCode::BROKER_FAILURE, e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Uploader: Created stream " << stream << " on subject " << subject;
  return subject;
}

//==============================================
// CHUNK PUBLISHING
//==============================================

void Uploader::publish_chunks(ChunkSource& source, const std::string& subject, TransferStats& stats) {
  PublishWindow window(options_.max_in_flight);
  std::vector<char> chunk;

  while (source.next(chunk)) {
    const std::size_t size = chunk.size();
    window.reserve();

    try {
      window.push(broker_.publish_async(subject, std::move(chunk)));
    }
    catch (const broker::BrokerError& e) {
      BOOST_LOG_TRIVIAL(error) << "Uploader: Error sending chunk to JetStream: " << e.what();
      throw TransferError(TransferErrorCode::PUBLISH_FAILED, e.what());
    }

    stats.bytes += size;
    ++stats.chunks;
    chunk = std::vector<char>();
  }

  window.drain();
  BOOST_LOG_TRIVIAL(debug) << "Uploader: Window high water mark " << window.high_water_mark()
                           << ", last acknowledged sequence " << window.last_sequence();
}

} // namespace transfer
} // namespace jsxfer
