/**
 * Tonnerre - Exception hierarchy. Every error carries the ErrorCode reported to close handlers.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "tonnerre/error_codes.hpp"

namespace tonnerre
{

    class MessagingError : public std::runtime_error
    {
    public:
        MessagingError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class InvalidPayload : public MessagingError
    {
    public:
        explicit InvalidPayload(std::string message);
    };

    // code() is either ErrorCode::UnknownKind or ErrorCode::Malformed.
    class ProtocolError : public MessagingError
    {
    public:
        ProtocolError(ErrorCode code, std::string message);
    };

    class PayloadTooLarge : public MessagingError
    {
    public:
        explicit PayloadTooLarge(std::string message);
    };

    class TimeoutError : public MessagingError
    {
    public:
        explicit TimeoutError(std::string message);
    };

    class ConnectionClosed : public MessagingError
    {
    public:
        explicit ConnectionClosed(std::string message);
    };

    class TransportError : public MessagingError
    {
    public:
        explicit TransportError(std::string message);
    };

} // namespace tonnerre
