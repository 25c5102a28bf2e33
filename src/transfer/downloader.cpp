#include "transfer/downloader.hpp"
#include "transfer/naming.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace jsxfer {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Downloader::Downloader(broker::Broker& broker, DownloadOptions options)
  : broker_(broker)
  , options_(std::move(options)) {}

//==============================================
// DOWNLOAD
//==============================================

TransferStats Downloader::download(const std::string& name) {
  const std::string stream = canonical_name(name);
  if (!names_a_file(name) || !is_valid_name(stream)) {
    throw TransferError(TransferErrorCode::INVALID_NAME, "cannot derive a stream name from \"" + name + "\"");
  }

  broker::StreamInfo info = lookup_stream(stream);
  if (info.config.subjects.empty()) {
    throw TransferError(TransferErrorCode::INVALID_STREAM, "stream \"" + stream + "\" has no subjects");
  }

  ChunkSink sink(options_.destination_dir / stream);

  Session session;
  session.subject = info.config.subjects.front();
  session.last_sequence = info.state.messages;

  BOOST_LOG_TRIVIAL(info) << "Downloader: Retrieving stream " << stream << " (" << session.last_sequence
                          << " messages) into " << sink.path().string();

  TransferStats stats;
  stats.stream = stream;
  const auto start = std::chrono::steady_clock::now();

  if (session.last_sequence > 0) {
    subscribe_at_expected(session);
    consume(session, sink, stats);
    session.subscription->unsubscribe();
  }

  stats.elapsed = std::chrono::steady_clock::now() - start;
  sink.close();
  return stats;
}

//==============================================
// STREAM LOOKUP
//==============================================

broker::StreamInfo Downloader::lookup_stream(const std::string& stream) {
  try {
    return broker_.stream_info(stream);
  }
  catch (const broker::BrokerError& e) {
    if (e.code() == broker::BrokerErrorCode::STREAM_NOT_FOUND) {
      BOOST_LOG_TRIVIAL(error) << "Downloader: Could not find stream: " << stream;
      throw TransferError(TransferErrorCode::STREAM_NOT_FOUND, "Could not find stream: " + stream);
    }
    throw TransferError(TransferErrorCode::BROKER_FAILURE, e.what());
  }
}

//==============================================
// CONSUMPTION
//==============================================

void Downloader::subscribe_at_expected(Session& session) {
  // Release the old consumer before asking for a replay
  if (session.subscription) {
    session.subscription->unsubscribe();
    session.subscription.reset();
  }

  broker::SubscribeOptions subscribe_options;
  subscribe_options.start_sequence = session.expected_sequence;
  subscribe_options.ack_none = true;
  subscribe_options.max_deliver = 1;
  subscribe_options.flow_control = true;

  try {
    session.subscription = broker_.subscribe(session.subject, subscribe_options);
  }
  catch (const broker::BrokerError& e) {
    BOOST_LOG_TRIVIAL(error) << "Downloader: Error creating consumer: " << e.what();
    throw TransferError(TransferErrorCode::BROKER_FAILURE, e.what());
  }

  session.state = State::SUBSCRIBED;
  BOOST_LOG_TRIVIAL(debug) << "Downloader: Subscribed to " << session.subject
                           << " from sequence " << session.expected_sequence;
}

void Downloader::consume(Session& session, ChunkSink& sink, TransferStats& stats) {
  auto timeout = options_.first_timeout;

  while (session.expected_sequence <= session.last_sequence) {
    broker::Message message = receive(session, timeout);
    timeout = options_.next_timeout;

    const std::uint64_t sequence = message.metadata.stream_sequence;
    if (sequence != session.expected_sequence) {
      session.state = State::GAP_DETECTED;
      BOOST_LOG_TRIVIAL(warning) << "Missed chunk sequence, expected " << session.expected_sequence
                                 << " but got " << sequence << ", resetting";

      session.state = State::RESUBSCRIBING;
      subscribe_at_expected(session);
      ++stats.resubscriptions;
      // New consumer, same startup latency as the first one
      timeout = options_.first_timeout;
      continue;
    }

    sink.write(message.payload);
    stats.bytes += message.payload.size();
    ++stats.chunks;
    ++session.expected_sequence;
  }
}

broker::Message Downloader::receive(Session& session, std::chrono::milliseconds timeout) {
  try {
    return session.subscription->next_message(timeout);
  }
  catch (const broker::BrokerError& e) {
    if (e.code() == broker::BrokerErrorCode::TIMEOUT) {
      BOOST_LOG_TRIVIAL(error) << "Downloader: Timed out waiting for sequence " << session.expected_sequence
                               << " of " << session.last_sequence;
      throw TransferError(TransferErrorCode::RECEIVE_TIMEOUT,
                          "no message for sequence " + std::to_string(session.expected_sequence) +
                          " of " + std::to_string(session.last_sequence));
    }
    throw TransferError(TransferErrorCode::BROKER_FAILURE, e.what());
  }
}

} // namespace transfer
} // namespace jsxfer
