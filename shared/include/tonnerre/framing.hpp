/**
 * Tonnerre - Type-tagged, length-prefixed message framing.
 *
 * Frame layout:
 *   [0]      kind tag (0 = KEY_VALUE, 1 = RAW_STRING)
 *   [1..4]   body length, u32 big-endian
 *   [5..]    body
 *
 * RAW_STRING bodies are UTF-8 text. KEY_VALUE bodies are a sequence of
 * (u16be key length, key, u16be value length, value) entries filling the body exactly.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "tonnerre/message.hpp"
#include "tonnerre/stream.hpp"

namespace tonnerre::protocol
{

    constexpr std::size_t kFrameHeaderSize = 5;
    constexpr std::size_t kMaxFieldLength = 0xFFFF;
    constexpr std::uint32_t kDefaultMaxBodySize = 16U * 1024U * 1024U;

    struct DecodedFrame
    {
        Message message;
        std::size_t bytes_consumed{};
    };

    // Throws PayloadTooLarge when a key, value or the whole body overflows its length field.
    std::vector<std::uint8_t> encode_frame(const Message &message);

    /**
     * Decodes the frame at the front of @p buffer.
     * @return nullopt while the buffer holds less than one complete frame.
     * @throws ProtocolError for an unknown kind tag, an oversized declared length or a malformed body.
     */
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::uint32_t max_body_size = kDefaultMaxBodySize);

    // Throws ProtocolError; never returns a partially populated message.
    Message decode_body(std::uint8_t kind_tag, std::span<const std::uint8_t> body);

    /**
     * Reads one frame from @p stream, blocking across partial reads.
     * @return nullopt when the stream closes before a complete header arrives (clean disconnect).
     * @throws ProtocolError, TimeoutError or TransportError.
     */
    std::optional<Message> read_frame(StreamSource &stream, std::optional<std::chrono::milliseconds> timeout,
                                      std::uint32_t max_body_size = kDefaultMaxBodySize);

} // namespace tonnerre::protocol
