#include "tonnerre/framing.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "tonnerre/errors.hpp"

namespace tonnerre::protocol
{

    namespace
    {
        constexpr std::size_t kLengthFieldSize = sizeof(std::uint16_t);

        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        std::uint16_t read_u16_be(std::span<const std::uint8_t> buffer)
        {
            return static_cast<std::uint16_t>((static_cast<std::uint16_t>(buffer[0]) << 8) | buffer[1]);
        }

        void write_u32_be(std::uint32_t value, std::vector<std::uint8_t> &out)
        {
            out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        }

        void write_u16_be(std::uint16_t value, std::vector<std::uint8_t> &out)
        {
            out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        }

        void append_field(const std::string &field, std::vector<std::uint8_t> &out)
        {
            write_u16_be(static_cast<std::uint16_t>(field.size()), out);
            out.insert(out.end(), field.begin(), field.end());
        }

        std::uint64_t body_size(const Message &message)
        {
            if (message.kind() == MessageKind::RawString)
            {
                return message.text().size();
            }
            std::uint64_t total = 0;
            for (const auto &[key, value] : message.pairs())
            {
                if (key.size() > kMaxFieldLength)
                {
                    throw PayloadTooLarge("key of " + std::to_string(key.size()) + " bytes exceeds " +
                                          std::to_string(kMaxFieldLength));
                }
                if (value.size() > kMaxFieldLength)
                {
                    throw PayloadTooLarge("value for key '" + key + "' of " + std::to_string(value.size()) +
                                          " bytes exceeds " + std::to_string(kMaxFieldLength));
                }
                total += 2 * kLengthFieldSize + key.size() + value.size();
            }
            return total;
        }

        MessageKind kind_from_tag(std::uint8_t tag)
        {
            switch (tag)
            {
            case static_cast<std::uint8_t>(MessageKind::KeyValue):
                return MessageKind::KeyValue;
            case static_cast<std::uint8_t>(MessageKind::RawString):
                return MessageKind::RawString;
            default:
                throw ProtocolError(ErrorCode::UnknownKind, "unknown message kind tag " + std::to_string(tag));
            }
        }

        std::uint32_t checked_body_length(std::span<const std::uint8_t> header, std::uint32_t max_body_size)
        {
            (void)kind_from_tag(header[0]);
            const auto length = read_u32_be(header.subspan(1, 4));
            if (length > max_body_size)
            {
                throw ProtocolError(ErrorCode::Malformed, "declared body length " + std::to_string(length) +
                                                              " exceeds limit " + std::to_string(max_body_size));
            }
            return length;
        }

        KeyValuePairs parse_entries(std::span<const std::uint8_t> body)
        {
            KeyValuePairs pairs;
            std::size_t offset = 0;
            const auto take_field = [&](const char *what)
            {
                if (body.size() - offset < kLengthFieldSize)
                {
                    throw ProtocolError(ErrorCode::Malformed, std::string("truncated ") + what + " length at offset " +
                                                                  std::to_string(offset));
                }
                const auto length = read_u16_be(body.subspan(offset, kLengthFieldSize));
                offset += kLengthFieldSize;
                if (body.size() - offset < length)
                {
                    throw ProtocolError(ErrorCode::Malformed, std::string(what) + " of " + std::to_string(length) +
                                                                  " bytes runs past end of body");
                }
                const auto begin = body.begin() + static_cast<std::ptrdiff_t>(offset);
                std::string field(begin, begin + length);
                offset += length;
                return field;
            };

            while (offset < body.size())
            {
                auto key = take_field("key");
                auto value = take_field("value");
                pairs.emplace_back(std::move(key), std::move(value));
            }
            return pairs;
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const Message &message)
    {
        const auto size = body_size(message);
        if (size > std::numeric_limits<std::uint32_t>::max())
        {
            throw PayloadTooLarge("message body of " + std::to_string(size) + " bytes too large to frame");
        }

        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + static_cast<std::size_t>(size));
        frame.push_back(static_cast<std::uint8_t>(message.kind()));
        write_u32_be(static_cast<std::uint32_t>(size), frame);

        if (message.kind() == MessageKind::RawString)
        {
            const auto &text = message.text();
            frame.insert(frame.end(), text.begin(), text.end());
            return frame;
        }
        for (const auto &[key, value] : message.pairs())
        {
            append_field(key, frame);
            append_field(value, frame);
        }
        return frame;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::uint32_t max_body_size)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto length = checked_body_length(buffer.first<kFrameHeaderSize>(), max_body_size);
        if (buffer.size() - kFrameHeaderSize < length)
        {
            return std::nullopt;
        }
        DecodedFrame result{
            .message = decode_body(buffer[0], buffer.subspan(kFrameHeaderSize, length)),
            .bytes_consumed = kFrameHeaderSize + length,
        };
        return result;
    }

    Message decode_body(std::uint8_t kind_tag, std::span<const std::uint8_t> body)
    {
        const auto kind = kind_from_tag(kind_tag);
        try
        {
            if (kind == MessageKind::RawString)
            {
                return make_raw_message(std::string(body.begin(), body.end()));
            }
            return make_key_value_message(parse_entries(body));
        }
        catch (const InvalidPayload &ex)
        {
            throw ProtocolError(ErrorCode::Malformed, ex.what());
        }
    }

    std::optional<Message> read_frame(StreamSource &stream, std::optional<std::chrono::milliseconds> timeout,
                                      std::uint32_t max_body_size)
    {
        std::array<std::uint8_t, kFrameHeaderSize> header{};
        const auto header_read = stream.read_exact(header, timeout);
        if (header_read < header.size())
        {
            if (header_read > 0)
            {
                spdlog::debug("Stream closed after {} of {} header bytes", header_read, header.size());
            }
            return std::nullopt;
        }

        const auto length = checked_body_length(header, max_body_size);
        std::vector<std::uint8_t> body(length);
        const auto body_read = stream.read_exact(body, timeout);
        if (body_read < body.size())
        {
            throw ProtocolError(ErrorCode::Malformed, "stream closed after " + std::to_string(body_read) + " of " +
                                                          std::to_string(length) + " body bytes");
        }
        return decode_body(header[0], body);
    }

} // namespace tonnerre::protocol
