#ifndef JSXFER_BROKER_NATS_STATUS_HPP
#define JSXFER_BROKER_NATS_STATUS_HPP

#include <string>
#include <nats/nats.h>
#include "broker/broker_error.hpp"

namespace jsxfer {
namespace broker {

// Maps a nats.c status and JetStream API error code onto a BrokerErrorCode.
// A bare NATS_NOT_FOUND is an API_ERROR here; only callers that looked up a
// stream translate it to STREAM_NOT_FOUND.
BrokerErrorCode broker_error_code(natsStatus status, jsErrCode js_error = static_cast<jsErrCode>(0));

// "<context>: <status text>[ (<nats.c last error>)][ [error code N]]"
BrokerError make_broker_error(natsStatus status, jsErrCode js_error, const std::string& context);
BrokerError make_broker_error(BrokerErrorCode code, natsStatus status, jsErrCode js_error, const std::string& context);

} // namespace broker
} // namespace jsxfer

#endif // JSXFER_BROKER_NATS_STATUS_HPP
