#ifndef JSXFER_BROKER_ERROR_HPP
#define JSXFER_BROKER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace jsxfer {
namespace broker {

enum class BrokerErrorCode {
    SUCCESS = 0,
    CONNECTION_FAILED,
    CONNECTION_CLOSED,
    AUTHORIZATION_FAILED,
    TIMEOUT,
    NO_RESPONDERS,
    STREAM_NOT_FOUND,
    STREAM_EXISTS,
    API_ERROR,
    PUBLISH_FAILED,
    INVALID_MESSAGE,
    INVALID_CREDENTIALS
};

inline const char* broker_error_to_string(BrokerErrorCode error) {
    switch (error) {
        case BrokerErrorCode::SUCCESS: return "Success";
        case BrokerErrorCode::CONNECTION_FAILED: return "Connection failed";
        case BrokerErrorCode::CONNECTION_CLOSED: return "Connection closed";
        case BrokerErrorCode::AUTHORIZATION_FAILED: return "Authorization failed";
        case BrokerErrorCode::TIMEOUT: return "Timeout";
        case BrokerErrorCode::NO_RESPONDERS: return "No responders";
        case BrokerErrorCode::STREAM_NOT_FOUND: return "Stream not found";
        case BrokerErrorCode::STREAM_EXISTS: return "Stream already exists";
        case BrokerErrorCode::API_ERROR: return "JetStream API error";
        case BrokerErrorCode::PUBLISH_FAILED: return "Publish failed";
        case BrokerErrorCode::INVALID_MESSAGE: return "Invalid message";
        case BrokerErrorCode::INVALID_CREDENTIALS: return "Invalid credentials";
        default: return "Undefined error";
    }
}

class BrokerError : public std::runtime_error {
public:
    BrokerError(BrokerErrorCode code, const std::string& message)
        : std::runtime_error(std::string(broker_error_to_string(code)) + ": " + message)
        , code_(code) {}

    BrokerErrorCode code() const { return code_; }

private:
    BrokerErrorCode code_;
};

} // namespace broker
} // namespace jsxfer

#endif // JSXFER_BROKER_ERROR_HPP
