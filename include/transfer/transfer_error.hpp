#ifndef JSXFER_TRANSFER_ERROR_HPP
#define JSXFER_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace jsxfer {
namespace transfer {

enum class TransferErrorCode {
    SUCCESS = 0,
    INVALID_NAME,
    FILE_OPEN_FAILED,
    FILE_READ_FAILED,
    FILE_WRITE_FAILED,
    STREAM_EXISTS,
    STREAM_NOT_FOUND,
    INVALID_STREAM,
    DESTINATION_EXISTS,
    PUBLISH_FAILED,
    RECEIVE_TIMEOUT,
    BROKER_FAILURE
};

inline const char* transfer_error_to_string(TransferErrorCode error) {
    switch (error) {
        case TransferErrorCode::SUCCESS: return "Success";
        case TransferErrorCode::INVALID_NAME: return "Invalid transfer name";
        case TransferErrorCode::FILE_OPEN_FAILED: return "File open failed";
        case TransferErrorCode::FILE_READ_FAILED: return "File read failed";
        case TransferErrorCode::FILE_WRITE_FAILED: return "File write failed";
        case TransferErrorCode::STREAM_EXISTS: return "Stream already exists";
        case TransferErrorCode::STREAM_NOT_FOUND: return "Stream not found";
        case TransferErrorCode::INVALID_STREAM: return "Invalid stream";
        case TransferErrorCode::DESTINATION_EXISTS: return "Destination file already exists";
        case TransferErrorCode::PUBLISH_FAILED: return "Publish failed";
        case TransferErrorCode::RECEIVE_TIMEOUT: return "Receive timeout";
        case TransferErrorCode::BROKER_FAILURE: return "Broker failure";
        default: return "Undefined error";
    }
}

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrorCode code, const std::string& message)
        : std::runtime_error(std::string(transfer_error_to_string(code)) + ": " + message)
        , code_(code) {}

    TransferErrorCode code() const { return code_; }

private:
    TransferErrorCode code_;
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_ERROR_HPP
