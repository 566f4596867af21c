#pragma once

#include "lexsync/core/result.hpp"
#include "lexsync/protocol/messages.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lexsync::protocol {

/**
 * @brief Serialization boundary between protocol logic and the wire
 *
 * The connection manager only ever hands Message values to a codec and
 * raw frames to the channel, so the format can change without touching
 * the state machine.
 */
class MessageCodec {
public:
    virtual ~MessageCodec() = default;

    /**
     * @brief Encode one message into a frame
     *
     * @return ErrorCode::Protocol when a field cannot be represented on the
     *         wire (e.g. a string that is not valid UTF-8)
     */
    virtual Result<std::vector<std::uint8_t>> encode(const Message& message) const = 0;

    /**
     * @brief Decode one frame
     *
     * @return ErrorCode::Protocol for anything malformed
     */
    virtual Result<Message> decode(const std::uint8_t* data, std::size_t size) const = 0;

    Result<Message> decode(const std::vector<std::uint8_t>& frame) const {
        return decode(frame.data(), frame.size());
    }
};

/**
 * @brief UTF-8 JSON objects with a camelCase `type` discriminator
 *
 * Byte payloads (file chunks) are JSON arrays of numbers 0-255, which is
 * what the browser client emits.
 */
class JsonCodec : public MessageCodec {
public:
    Result<std::vector<std::uint8_t>> encode(const Message& message) const override;

    using MessageCodec::decode;
    Result<Message> decode(const std::uint8_t* data, std::size_t size) const override;
};

} // namespace lexsync::protocol
