#include "broker/nats_connection.hpp"
#include "broker/nats_status.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <sstream>

namespace jsxfer {
namespace broker {

std::vector<std::string> split_server_list(const std::string& servers) {
  std::vector<std::string> urls;
  std::istringstream iss(servers);
  std::string url;
  while (std::getline(iss, url, ',')) {
    const auto first = url.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = url.find_last_not_of(" \t");
    urls.push_back(url.substr(first, last - first + 1));
  }
  return urls;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

NatsConnection::NatsConnection(ConnectionOptions options)
  : options_(std::move(options)) {}

NatsConnection::~NatsConnection() {
  close();
  if (connection_ != nullptr) {
    natsConnection_Destroy(connection_);
  }
  if (nats_options_ != nullptr) {
    natsOptions_Destroy(nats_options_);
  }
}

//==============================================
// CONNECTION CONTROL
//==============================================

void NatsConnection::configure() {
  const std::vector<std::string> urls = split_server_list(options_.servers);
  if (urls.empty()) {
    throw BrokerError(BrokerErrorCode::CONNECTION_FAILED, "no server URL given");
  }
  std::vector<const char*> servers;
  for (const auto& url : urls) {
    servers.push_back(url.c_str());
  }

  if (nats_options_ != nullptr) {
    natsOptions_Destroy(nats_options_);
    nats_options_ = nullptr;
  }
  natsStatus s = natsOptions_Create(&nats_options_);
  if (s == NATS_OK) s = natsOptions_SetServers(nats_options_, servers.data(), static_cast<int>(servers.size()));
  if (s == NATS_OK) s = natsOptions_SetName(nats_options_, options_.name.c_str());
  if (s == NATS_OK) s = natsOptions_SetReconnectWait(nats_options_, options_.reconnect_wait.count());
  if (s == NATS_OK) s = natsOptions_SetMaxReconnect(nats_options_, options_.max_reconnects);
  if (s == NATS_OK) s = natsOptions_SetDisconnectedCB(nats_options_, &NatsConnection::on_disconnected, this);
  if (s == NATS_OK) s = natsOptions_SetReconnectedCB(nats_options_, &NatsConnection::on_reconnected, this);
  if (s == NATS_OK) s = natsOptions_SetClosedCB(nats_options_, &NatsConnection::on_closed, this);
  if (s != NATS_OK) {
    throw make_broker_error(BrokerErrorCode::CONNECTION_FAILED, s, static_cast<jsErrCode>(0), "configuring connection");
  }

  if (!options_.creds_file.empty()) {
    // nats.c only reads the file while connecting; fail early with a clear message
    if (!std::ifstream(options_.creds_file)) {
      BOOST_LOG_TRIVIAL(error) << "NATS: Cannot read credentials file " << options_.creds_file;
      throw BrokerError(BrokerErrorCode::INVALID_CREDENTIALS, "cannot read " + options_.creds_file);
    }
    s = natsOptions_SetUserCredentialsFromFiles(nats_options_, options_.creds_file.c_str(), nullptr);
    if (s != NATS_OK) {
      throw make_broker_error(BrokerErrorCode::INVALID_CREDENTIALS, s, static_cast<jsErrCode>(0),
                              "loading " + options_.creds_file);
    }
  }
}

void NatsConnection::connect() {
  if (connection_ != nullptr) {
    return;
  }
  configure();

  BOOST_LOG_TRIVIAL(debug) << "NATS: Connecting to " << options_.servers;
  const natsStatus s = natsConnection_Connect(&connection_, nats_options_);
  if (s != NATS_OK) {
    connection_ = nullptr;
    const BrokerErrorCode code = s == NATS_CONNECTION_AUTH_FAILED || s == NATS_NOT_PERMITTED
                                   ? BrokerErrorCode::AUTHORIZATION_FAILED
                                   : BrokerErrorCode::CONNECTION_FAILED;
    BOOST_LOG_TRIVIAL(error) << "NATS: Failed to connect to " << options_.servers << ": " << natsStatus_GetText(s);
    throw make_broker_error(code, s, static_cast<jsErrCode>(0), "connecting to " + options_.servers);
  }

  BOOST_LOG_TRIVIAL(info) << "NATS: Connected to " << connected_url();
}

void NatsConnection::close() {
  if (connection_ == nullptr || closing_.exchange(true)) {
    return;
  }
  natsConnection_Close(connection_);
  BOOST_LOG_TRIVIAL(debug) << "NATS: Closed connection";
}

//==============================================
// GETTERS
//==============================================

bool NatsConnection::is_closed() const {
  return connection_ == nullptr || natsConnection_IsClosed(connection_);
}

std::string NatsConnection::connected_url() const {
  if (connection_ == nullptr) {
    return "";
  }
  char buffer[256] = {0};
  if (natsConnection_GetConnectedUrl(connection_, buffer, sizeof(buffer)) != NATS_OK) {
    return "";
  }
  return buffer;
}

std::string NatsConnection::last_error() const {
  if (connection_ == nullptr) {
    return "";
  }
  const char* text = nullptr;
  const natsStatus s = natsConnection_GetLastError(connection_, &text);
  if (s == NATS_OK) {
    return "";
  }
  return text != nullptr && *text != '\0' ? text : natsStatus_GetText(s);
}

natsConnection* NatsConnection::handle() const {
  if (connection_ == nullptr) {
    throw BrokerError(BrokerErrorCode::CONNECTION_CLOSED, "not connected");
  }
  return connection_;
}

//==============================================
// CONNECTION EVENTS
//==============================================

void NatsConnection::on_disconnected(natsConnection*, void* closure) {
  auto* self = static_cast<NatsConnection*>(closure);
  if (self->closing_) {
    return;
  }
  const auto total_wait = std::chrono::duration_cast<std::chrono::seconds>(
    self->options_.reconnect_wait * self->options_.max_reconnects);
  BOOST_LOG_TRIVIAL(warning) << "Disconnected due to: " << self->last_error()
                             << ", will attempt reconnects for " << total_wait.count() << "s";
}

void NatsConnection::on_reconnected(natsConnection*, void* closure) {
  auto* self = static_cast<NatsConnection*>(closure);
  BOOST_LOG_TRIVIAL(info) << "Reconnected [" << self->connected_url() << "]";
}

void NatsConnection::on_closed(natsConnection*, void* closure) {
  auto* self = static_cast<NatsConnection*>(closure);
  if (self->closing_) {
    return;
  }
  const std::string reason = self->last_error();
  BOOST_LOG_TRIVIAL(error) << "Exiting: " << reason;
  if (self->options_.closed_handler) {
    self->options_.closed_handler(reason);
  }
}

} // namespace broker
} // namespace jsxfer
