#pragma once

#include "pod_protocol/message.hpp"
#include "pod_protocol/types.hpp"

#include <cstdint>
#include <vector>

namespace pod_protocol {

/**
 * @brief Static description of one message kind
 */
struct MessageDescriptor {
    MessageKind kind;
    const char* name;
    uint16_t command;
    uint16_t direction;
    uint16_t format;
    BodyType bodyType;
};

/**
 * @brief Table of every known (command, direction) pair
 */
class MessageRegistry {
public:
    /**
     * @brief All descriptors in registration order
     */
    static const std::vector<MessageDescriptor>& entries();

    /**
     * @brief Look up the descriptor for a received header
     *
     * Tries the exact (command, direction) pair first, then the first entry
     * registered with the same command.
     *
     * @return Descriptor, or nullptr if the command is unknown
     */
    static const MessageDescriptor* find(uint16_t command, uint16_t direction);

    /**
     * @brief Descriptor for a message kind
     * @throws ValidationError for MessageKind::UNKNOWN
     */
    static const MessageDescriptor& byKind(MessageKind kind);

    /**
     * @brief Encoded body size of a fixed shape, 0 for variable shapes
     */
    static size_t fixedBodySize(BodyType type);
};

/**
 * @brief Default body of a shape
 */
Message::Body makeDefaultBody(BodyType type);

/**
 * @brief Build a message of the given kind with its default body
 *
 * Header fields come from the registry; the packet sequence is left at 0
 * and stamped by the session when the message is sent.
 */
Message makeMessage(MessageKind kind);

/**
 * @brief Build a message of the given kind with the provided body
 */
Message makeMessage(MessageKind kind, Message::Body body);

} // namespace pod_protocol
