#include "broker/jetstream.hpp"
#include "broker/nats_status.hpp"
#include <boost/log/trivial.hpp>

namespace jsxfer {
namespace broker {

namespace {

constexpr jsErrCode NO_JS_ERROR = static_cast<jsErrCode>(0);

struct StreamInfoDeleter {
  void operator()(jsStreamInfo* info) const { jsStreamInfo_Destroy(info); }
};

struct MsgDeleter {
  void operator()(natsMsg* msg) const { natsMsg_Destroy(msg); }
};

struct MetaDataDeleter {
  void operator()(jsMsgMetaData* meta) const { jsMsgMetaData_Destroy(meta); }
};

using StreamInfoPtr = std::unique_ptr<jsStreamInfo, StreamInfoDeleter>;

StreamInfo to_stream_info(const jsStreamInfo& native) {
  StreamInfo info;
  if (native.Config != nullptr) {
    info.config.name = native.Config->Name != nullptr ? native.Config->Name : "";
    for (int i = 0; i < native.Config->SubjectsLen; ++i) {
      info.config.subjects.emplace_back(native.Config->Subjects[i]);
    }
    info.config.num_replicas = static_cast<int>(native.Config->Replicas);
  }
  info.state.messages = native.State.Msgs;
  info.state.bytes = native.State.Bytes;
  info.state.first_seq = native.State.FirstSeq;
  info.state.last_seq = native.State.LastSeq;
  return info;
}

} // namespace

//==============================================
// SUBSCRIPTION
//==============================================

JetStreamSubscription::JetStreamSubscription(natsSubscription* subscription)
  : subscription_(subscription) {}

JetStreamSubscription::~JetStreamSubscription() {
  try {
    unsubscribe();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "JetStream: Error during unsubscribe: " << e.what();
  }
  natsSubscription_Destroy(subscription_);
}

Message JetStreamSubscription::next_message(std::chrono::milliseconds timeout) {
  natsMsg* raw = nullptr;
  const natsStatus s = natsSubscription_NextMsg(&raw, subscription_, timeout.count());
  if (s == NATS_TIMEOUT) {
    throw BrokerError(BrokerErrorCode::TIMEOUT, "no message within " + std::to_string(timeout.count()) + "ms");
  }
  if (s != NATS_OK) {
    throw make_broker_error(s, NO_JS_ERROR, "receiving message");
  }
  std::unique_ptr<natsMsg, MsgDeleter> msg(raw);

  jsMsgMetaData* raw_meta = nullptr;
  const natsStatus meta_status = natsMsg_GetMetaData(&raw_meta, msg.get());
  if (meta_status != NATS_OK) {
    throw make_broker_error(BrokerErrorCode::INVALID_MESSAGE, meta_status, NO_JS_ERROR, "reading message metadata");
  }
  std::unique_ptr<jsMsgMetaData, MetaDataDeleter> meta(raw_meta);

  Message message;
  message.subject = natsMsg_GetSubject(msg.get());
  const char* data = natsMsg_GetData(msg.get());
  message.payload.assign(data, data + natsMsg_GetDataLength(msg.get()));
  message.metadata.stream = meta->Stream != nullptr ? meta->Stream : "";
  message.metadata.consumer = meta->Consumer != nullptr ? meta->Consumer : "";
  message.metadata.num_delivered = meta->NumDelivered;
  message.metadata.stream_sequence = meta->Sequence.Stream;
  message.metadata.consumer_sequence = meta->Sequence.Consumer;
  message.metadata.timestamp_ns = meta->Timestamp;
  message.metadata.num_pending = meta->NumPending;
  return message;
}

void JetStreamSubscription::unsubscribe() {
  if (unsubscribed_) {
    return;
  }
  unsubscribed_ = true;

  const natsStatus s = natsSubscription_Unsubscribe(subscription_);
  if (s != NATS_OK) {
    // Consumer deletion is best effort; the broker reaps idle ephemerals
    BOOST_LOG_TRIVIAL(warning) << "JetStream: Failed to remove consumer: " << natsStatus_GetText(s);
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

JetStream::JetStream(NatsConnection& connection, JetStreamOptions options)
  : connection_(connection)
  , options_(std::move(options)) {
  jsOptions js_options;
  jsOptions_Init(&js_options);
  js_options.Wait = options_.request_timeout.count();
  js_options.PublishAsync.MaxPending = options_.max_pending;
  js_options.PublishAsync.AckHandler = &JetStream::on_publish_ack;
  js_options.PublishAsync.AckHandlerClosure = this;

  const natsStatus s = natsConnection_JetStream(&context_, connection_.handle(), &js_options);
  if (s != NATS_OK) {
    throw make_broker_error(s, NO_JS_ERROR, "creating JetStream context");
  }
}

JetStream::~JetStream() {
  jsPubOptions pub_options;
  jsPubOptions_Init(&pub_options);
  pub_options.MaxWait = options_.publish_timeout.count();

  const natsStatus s = js_PublishAsyncComplete(context_, &pub_options);
  if (s != NATS_OK) {
    BOOST_LOG_TRIVIAL(warning) << "JetStream: Outstanding acknowledgements at shutdown: " << natsStatus_GetText(s);
  }
  abandon_pending("JetStream context destroyed");
  jsCtx_Destroy(context_);
}

//==============================================
// STREAM MANAGEMENT
//==============================================

StreamInfo JetStream::stream_info(const std::string& name) {
  jsStreamInfo* raw = nullptr;
  jsErrCode js_error = NO_JS_ERROR;
  const natsStatus s = js_GetStreamInfo(&raw, context_, name.c_str(), nullptr, &js_error);
  StreamInfoPtr info(raw);

  // A lookup by name that finds nothing is the one place a bare NOT_FOUND means "no stream"
  if (s == NATS_NOT_FOUND) {
    throw BrokerError(BrokerErrorCode::STREAM_NOT_FOUND, "stream " + name + " not found");
  }
  if (s != NATS_OK) {
    throw make_broker_error(s, js_error, "stream info for " + name);
  }
  return to_stream_info(*info);
}

StreamInfo JetStream::create_stream(const StreamConfig& config) {
  std::vector<const char*> subjects;
  for (const auto& subject : config.subjects) {
    subjects.push_back(subject.c_str());
  }

  jsStreamConfig native;
  jsStreamConfig_Init(&native);
  native.Name = config.name.c_str();
  native.Subjects = subjects.data();
  native.SubjectsLen = static_cast<int>(subjects.size());
  native.Retention = js_LimitsPolicy;
  native.Storage = js_FileStorage;
  native.Replicas = config.num_replicas;

  jsStreamInfo* raw = nullptr;
  jsErrCode js_error = NO_JS_ERROR;
  const natsStatus s = js_AddStream(&raw, context_, &native, nullptr, &js_error);
  StreamInfoPtr info(raw);
  if (s != NATS_OK) {
    throw make_broker_error(s, js_error, "creating stream " + config.name);
  }

  BOOST_LOG_TRIVIAL(debug) << "JetStream: Created stream " << config.name;
  return to_stream_info(*info);
}

void JetStream::delete_stream(const std::string& name) {
  jsErrCode js_error = NO_JS_ERROR;
  const natsStatus s = js_DeleteStream(context_, name.c_str(), nullptr, &js_error);
  if (s == NATS_NOT_FOUND) {
    throw BrokerError(BrokerErrorCode::STREAM_NOT_FOUND, "stream " + name + " not found");
  }
  if (s != NATS_OK) {
    throw make_broker_error(s, js_error, "deleting stream " + name);
  }
  BOOST_LOG_TRIVIAL(debug) << "JetStream: Deleted stream " << name;
}

//==============================================
// PUBLISHING
//==============================================

std::future<PubAck> JetStream::publish_async(const std::string& subject, std::vector<char> payload) {
  natsMsg* msg = nullptr;
  natsStatus s = natsMsg_Create(&msg, subject.c_str(), nullptr, payload.data(), static_cast<int>(payload.size()));
  if (s != NATS_OK) {
    throw make_broker_error(BrokerErrorCode::PUBLISH_FAILED, s, NO_JS_ERROR, "creating message");
  }

  // Registered before publishing; the ack can arrive before js_PublishMsgAsync returns
  std::future<PubAck> future;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    future = pending_[msg].get_future();
  }

  jsPubOptions pub_options;
  jsPubOptions_Init(&pub_options);
  pub_options.MaxWait = options_.publish_timeout.count();

  natsMsg* handed_over = msg;
  s = js_PublishMsgAsync(context_, &handed_over, &pub_options);
  if (s != NATS_OK) {
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      pending_.erase(msg);
    }
    // Still ours when the publish was refused
    if (handed_over != nullptr) {
      natsMsg_Destroy(handed_over);
    }
    throw make_broker_error(BrokerErrorCode::PUBLISH_FAILED, s, NO_JS_ERROR, "publishing to " + subject);
  }
  return future;
}

void JetStream::on_publish_ack(jsCtx*, natsMsg* msg, jsPubAck* ack, jsPubAckErr* error, void* closure) {
  static_cast<JetStream*>(closure)->complete(msg, ack, error);
  natsMsg_Destroy(msg);
}

void JetStream::complete(natsMsg* msg, const jsPubAck* ack, const jsPubAckErr* error) {
  std::promise<PubAck> promise;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(msg);
    if (it == pending_.end()) {
      return;
    }
    promise = std::move(it->second);
    pending_.erase(it);
  }

  if (error != nullptr || ack == nullptr) {
    std::string reason = "no acknowledgement";
    if (error != nullptr) {
      reason = error->ErrText != nullptr ? error->ErrText : natsStatus_GetText(error->Err);
      if (error->ErrCode != 0) {
        reason += " [error code " + std::to_string(static_cast<int>(error->ErrCode)) + "]";
      }
    }
    BOOST_LOG_TRIVIAL(error) << "JetStream: Error sending chunk: " << reason;
    promise.set_exception(std::make_exception_ptr(BrokerError(BrokerErrorCode::PUBLISH_FAILED, reason)));
    return;
  }

  PubAck result;
  result.stream = ack->Stream != nullptr ? ack->Stream : "";
  result.sequence = ack->Sequence;
  result.duplicate = ack->Duplicate;
  promise.set_value(result);
}

void JetStream::abandon_pending(const std::string& reason) {
  // Take back what nats.c still holds so its ack handler no longer fires for it
  natsMsgList list = {nullptr, 0};
  if (js_PublishAsyncGetPendingList(&list, context_) == NATS_OK) {
    natsMsgList_Destroy(&list);
  }

  std::lock_guard<std::mutex> lock(pending_mutex_);
  for (auto& entry : pending_) {
    entry.second.set_exception(std::make_exception_ptr(BrokerError(BrokerErrorCode::CONNECTION_CLOSED, reason)));
  }
  pending_.clear();
}

//==============================================
// CONSUMING
//==============================================

std::unique_ptr<Subscription> JetStream::subscribe(const std::string& subject, const SubscribeOptions& options) {
  jsSubOptions sub_options;
  jsSubOptions_Init(&sub_options);
  sub_options.Config.DeliverPolicy = js_DeliverByStartSequence;
  sub_options.Config.OptStartSeq = options.start_sequence;
  sub_options.Config.AckPolicy = options.ack_none ? js_AckNone : js_AckExplicit;
  sub_options.Config.MaxDeliver = options.max_deliver;
  sub_options.Config.FlowControl = options.flow_control;
  // Flow control needs idle heartbeats; the value is in nanoseconds
  sub_options.Config.Heartbeat =
    std::chrono::duration_cast<std::chrono::nanoseconds>(options.idle_heartbeat).count();

  natsSubscription* subscription = nullptr;
  jsErrCode js_error = NO_JS_ERROR;
  const natsStatus s = js_SubscribeSync(&subscription, context_, subject.c_str(), nullptr, &sub_options, &js_error);
  if (s == NATS_NOT_FOUND) {
    // nats.c resolves the stream from the subject first
    throw BrokerError(BrokerErrorCode::STREAM_NOT_FOUND, "no stream captures " + subject);
  }
  if (s != NATS_OK) {
    throw make_broker_error(s, js_error, "creating consumer on " + subject);
  }

  BOOST_LOG_TRIVIAL(debug) << "JetStream: Consumer on " << subject << " from sequence " << options.start_sequence;
  return std::make_unique<JetStreamSubscription>(subscription);
}

//==============================================
// UTILITIES
//==============================================

std::string JetStream::new_inbox() {
  natsInbox* inbox = nullptr;
  const natsStatus s = natsInbox_Create(&inbox);
  if (s != NATS_OK) {
    throw make_broker_error(s, NO_JS_ERROR, "creating inbox");
  }
  std::string result(inbox);
  natsInbox_Destroy(inbox);
  return result;
}

} // namespace broker
} // namespace jsxfer
