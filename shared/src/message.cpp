#include "tonnerre/message.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <unordered_set>

#include "tonnerre/errors.hpp"

namespace tonnerre
{

    namespace
    {

        struct MessageKindMapping
        {
            MessageKind kind;
            std::string_view label;
        };

        constexpr std::array<MessageKindMapping, 2> kKindMappings{{
            {MessageKind::KeyValue, "KEY_VALUE"},
            {MessageKind::RawString, "RAW_STRING"},
        }};

        KeyValuePairs sorted_copy(const KeyValuePairs &pairs)
        {
            KeyValuePairs sorted = pairs;
            std::sort(sorted.begin(), sorted.end());
            return sorted;
        }

    } // namespace

    std::string_view to_string(MessageKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    Message::Message(KeyValuePairs pairs) : payload_(std::move(pairs)) {}

    Message::Message(std::string text) : payload_(std::move(text)) {}

    MessageKind Message::kind() const noexcept
    {
        return std::holds_alternative<KeyValuePairs>(payload_) ? MessageKind::KeyValue : MessageKind::RawString;
    }

    const KeyValuePairs &Message::pairs() const
    {
        return std::get<KeyValuePairs>(payload_);
    }

    const std::string &Message::text() const
    {
        return std::get<std::string>(payload_);
    }

    std::optional<std::string_view> Message::find(std::string_view key) const
    {
        const auto *pairs = std::get_if<KeyValuePairs>(&payload_);
        if (pairs == nullptr)
        {
            return std::nullopt;
        }
        for (const auto &[name, value] : *pairs)
        {
            if (name == key)
            {
                return std::string_view(value);
            }
        }
        return std::nullopt;
    }

    bool operator==(const Message &lhs, const Message &rhs)
    {
        if (lhs.kind() != rhs.kind())
        {
            return false;
        }
        if (lhs.kind() == MessageKind::RawString)
        {
            return lhs.text() == rhs.text();
        }
        if (lhs.pairs().size() != rhs.pairs().size())
        {
            return false;
        }
        return sorted_copy(lhs.pairs()) == sorted_copy(rhs.pairs());
    }

    Message make_key_value_message(KeyValuePairs pairs)
    {
        std::unordered_set<std::string_view> seen;
        seen.reserve(pairs.size());
        for (const auto &[key, value] : pairs)
        {
            if (key.empty())
            {
                throw InvalidPayload("key/value message contains an empty key");
            }
            if (!seen.insert(key).second)
            {
                throw InvalidPayload("duplicate key '" + key + "' in key/value message");
            }
        }
        return Message(std::move(pairs));
    }

    Message make_raw_message(std::string text)
    {
        if (!is_valid_utf8(text))
        {
            throw InvalidPayload("raw message text is not valid UTF-8");
        }
        return Message(std::move(text));
    }

    bool is_valid_utf8(std::string_view text) noexcept
    {
        std::size_t i = 0;
        while (i < text.size())
        {
            const auto lead = static_cast<unsigned char>(text[i]);
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint32_t code_point = 0;
            if ((lead & 0xE0) == 0xC0)
            {
                length = 2;
                code_point = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length = 3;
                code_point = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length = 4;
                code_point = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (i + length > text.size())
            {
                return false;
            }
            for (std::size_t j = 1; j < length; ++j)
            {
                const auto next = static_cast<unsigned char>(text[i + j]);
                if ((next & 0xC0) != 0x80)
                {
                    return false;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }

            // Reject overlong forms, UTF-16 surrogates and anything past U+10FFFF.
            constexpr std::array<std::uint32_t, 5> kMinimum{0, 0, 0x80, 0x800, 0x10000};
            if (code_point < kMinimum[length] || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF))
            {
                return false;
            }
            i += length;
        }
        return true;
    }

    std::string describe(const Message &message)
    {
        std::ostringstream out;
        out << to_string(message.kind());
        if (message.kind() == MessageKind::RawString)
        {
            out << " (" << message.text().size() << " bytes)";
            return out.str();
        }
        out << " {";
        bool first = true;
        for (const auto &[key, value] : message.pairs())
        {
            if (!first)
            {
                out << ", ";
            }
            out << key << '=' << value;
            first = false;
        }
        out << '}';
        return out.str();
    }

} // namespace tonnerre
