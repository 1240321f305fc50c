#pragma once

#include "pod_protocol/bodies.hpp"
#include "pod_protocol/error.hpp"
#include "pod_protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace pod_protocol {

/**
 * @brief The 12 byte command header in front of every logical message
 */
struct CommandHeader {
    uint16_t command = 0;
    uint16_t direction = 0;
    uint16_t format = DEFAULT_FORMAT;
    uint16_t packetSequence = 0;
    uint32_t bodyLength = 0;

    bool operator==(const CommandHeader& other) const {
        return command == other.command && direction == other.direction && format == other.format &&
               packetSequence == other.packetSequence && bodyLength == other.bodyLength;
    }
    bool operator!=(const CommandHeader& other) const { return !(*this == other); }

    std::string toString() const;
};

/**
 * @brief A command or reply as exchanged with the pod
 *
 * The header identifies the kind, the body holds the typed content. Bytes
 * past the end of a fixed size body are kept as trailing bytes so that a
 * decoded message encodes back to the same bytes.
 */
class Message {
public:
    using Body = std::variant<
        EmptyBody,
        DeviceInfoRequestBody,
        DeviceInfoBody,
        DeviceStatusBody,
        DateTimeBody,
        LogCountBody,
        LogStepBody,
        LogEntryBody,
        DataRequestBody,
        DataBlockBody,
        PersonalSettingsBody,
        LogSettingsBody,
        SgeeDateBody,
        RawBody
    >;

    /**
     * @brief Default constructor - creates an unknown message with a raw body
     */
    Message();

    Message(MessageKind kind, const CommandHeader& header, Body body, Bytes trailing = {});

    MessageKind getKind() const { return kind_; }
    std::string getName() const { return messageKindToString(kind_); }

    const CommandHeader& getHeader() const { return header_; }
    CommandHeader& getHeader() { return header_; }

    const Body& getBody() const { return body_; }
    Body& getBody() { return body_; }

    const Bytes& getTrailing() const { return trailing_; }

    void setPacketSequence(uint16_t sequence) { header_.packetSequence = sequence; }

    /**
     * @brief Access the body as a specific shape
     * @throws FieldAccessError if the body has another shape
     */
    template<typename T>
    const T& getBodyAs() const {
        if (const T* body = std::get_if<T>(&body_)) {
            return *body;
        }
        throw FieldAccessError("message " + getName() + " does not carry the requested body");
    }

    template<typename T>
    T& getBodyAs() {
        if (T* body = std::get_if<T>(&body_)) {
            return *body;
        }
        throw FieldAccessError("message " + getName() + " does not carry the requested body");
    }

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(body_); }

    // Serialization
    nlohmann::json toJson() const;
    std::string toString() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    MessageKind kind_;
    CommandHeader header_;
    Body body_;
    Bytes trailing_;
};

} // namespace pod_protocol
