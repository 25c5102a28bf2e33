#include "broker/nats_status.hpp"

namespace jsxfer {
namespace broker {

BrokerErrorCode broker_error_code(natsStatus status, jsErrCode js_error) {
  // The JetStream error code is more specific than the status
  switch (js_error) {
    case JSStreamNameExistErr: return BrokerErrorCode::STREAM_EXISTS;
    case JSStreamNotFoundErr: return BrokerErrorCode::STREAM_NOT_FOUND;
    default: break;
  }

  switch (status) {
    case NATS_TIMEOUT: return BrokerErrorCode::TIMEOUT;
    case NATS_NO_RESPONDERS: return BrokerErrorCode::NO_RESPONDERS;
    case NATS_CONNECTION_CLOSED: return BrokerErrorCode::CONNECTION_CLOSED;
    case NATS_CONNECTION_AUTH_FAILED: return BrokerErrorCode::AUTHORIZATION_FAILED;
    case NATS_NO_SERVER: return BrokerErrorCode::CONNECTION_FAILED;
    default: return BrokerErrorCode::API_ERROR;
  }
}

BrokerError make_broker_error(BrokerErrorCode code, natsStatus status, jsErrCode js_error,
                              const std::string& context) {
  std::string message = context + ": " + natsStatus_GetText(status);

  natsStatus last_status = NATS_OK;
  const char* last_error = nats_GetLastError(&last_status);
  if (last_error != nullptr && *last_error != '\0' && last_status == status) {
    message += std::string(" (") + last_error + ")";
  }
  if (js_error != 0) {
    message += " [error code " + std::to_string(static_cast<int>(js_error)) + "]";
  }
  return BrokerError(code, message);
}

BrokerError make_broker_error(natsStatus status, jsErrCode js_error, const std::string& context) {
  return make_broker_error(broker_error_code(status, js_error), status, js_error, context);
}

} // namespace broker
} // namespace jsxfer
