#include "tonnerre/errors.hpp"

#include <utility>

namespace tonnerre
{

    MessagingError::MessagingError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    InvalidPayload::InvalidPayload(std::string message)
        : MessagingError(ErrorCode::InvalidPayload, std::move(message)) {}

    ProtocolError::ProtocolError(ErrorCode code, std::string message)
        : MessagingError(code, std::move(message)) {}

    PayloadTooLarge::PayloadTooLarge(std::string message)
        : MessagingError(ErrorCode::PayloadTooLarge, std::move(message)) {}

    TimeoutError::TimeoutError(std::string message)
        : MessagingError(ErrorCode::Timeout, std::move(message)) {}

    ConnectionClosed::ConnectionClosed(std::string message)
        : MessagingError(ErrorCode::ConnectionClosed, std::move(message)) {}

    TransportError::TransportError(std::string message)
        : MessagingError(ErrorCode::TransportError, std::move(message)) {}

} // namespace tonnerre
