/**
 * Tonnerre - Message model: a key/value mapping or a raw UTF-8 string.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tonnerre
{

    // Values double as the wire tag.
    enum class MessageKind : std::uint8_t
    {
        KeyValue = 0,
        RawString = 1
    };

    std::string_view to_string(MessageKind kind) noexcept;

    using KeyValuePair = std::pair<std::string, std::string>;
    using KeyValuePairs = std::vector<KeyValuePair>;

    class Message
    {
    public:
        MessageKind kind() const noexcept;

        // Throws std::bad_variant_access when called on the other kind.
        const KeyValuePairs &pairs() const;
        const std::string &text() const;

        std::optional<std::string_view> find(std::string_view key) const;

        // Key/value messages compare as sets; wire order is not significant.
        friend bool operator==(const Message &lhs, const Message &rhs);

    private:
        explicit Message(KeyValuePairs pairs);
        explicit Message(std::string text);

        friend Message make_key_value_message(KeyValuePairs pairs);
        friend Message make_raw_message(std::string text);

        std::variant<KeyValuePairs, std::string> payload_;
    };

    /**
     * Builds a KEY_VALUE message, preserving the order of @p pairs.
     * Throws InvalidPayload on an empty or duplicated key.
     */
    Message make_key_value_message(KeyValuePairs pairs);

    /**
     * Builds a RAW_STRING message. Throws InvalidPayload unless @p text is valid UTF-8.
     */
    Message make_raw_message(std::string text);

    bool is_valid_utf8(std::string_view text) noexcept;

    // One-line rendering for logs.
    std::string describe(const Message &message);

} // namespace tonnerre
