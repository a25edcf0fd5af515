#include "tonnerre/error_codes.hpp"

#include <array>

namespace tonnerre
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 8> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::UnknownKind, "unknown_kind"},
            {ErrorCode::Malformed, "malformed"},
            {ErrorCode::PayloadTooLarge, "payload_too_large"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::ConnectionClosed, "connection_closed"},
            {ErrorCode::TransportError, "transport_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace tonnerre
