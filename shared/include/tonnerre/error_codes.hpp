/**
 * Tonnerre - Error codes shared by the codec, connections and listeners.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace tonnerre
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPayload = 1,
        UnknownKind = 2,
        Malformed = 3,
        PayloadTooLarge = 4,
        Timeout = 5,
        ConnectionClosed = 6,
        TransportError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace tonnerre
