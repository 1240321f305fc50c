#include "pod_protocol/message.hpp"
#include "pod_protocol/text.hpp"

#include <fmt/format.h>

namespace pod_protocol {

std::string CommandHeader::toString() const {
    return fmt::format("cmd 0x{:04X}, dir:0x{:04X} fmt 0x{:02X}, packseq 0x{:02X}, len {:02d}",
                       command, direction, format, packetSequence, bodyLength);
}

Message::Message()
    : kind_(MessageKind::UNKNOWN)
    , body_(RawBody{})
{
}

Message::Message(MessageKind kind, const CommandHeader& header, Body body, Bytes trailing)
    : kind_(kind)
    , header_(header)
    , body_(std::move(body))
    , trailing_(std::move(trailing))
{
}

nlohmann::json Message::toJson() const {
    nlohmann::json json;

    json["kind"] = getName();
    json["command"] = header_.command;
    json["direction"] = header_.direction;
    json["format"] = header_.format;
    json["sequence"] = header_.packetSequence;
    json["length"] = header_.bodyLength;
    json["body"] = std::visit([](const auto& body) { return body.toJson(); }, body_);

    if (!trailing_.empty()) {
        json["trailing"] = toHex(trailing_);
    }

    return json;
}

std::string Message::toString() const {
    const std::string body = std::visit([](const auto& b) { return b.toString(); }, body_);
    return fmt::format("<{} {}, {}>", getName(), header_.toString(), body);
}

bool Message::operator==(const Message& other) const {
    return kind_ == other.kind_ && header_ == other.header_ && body_ == other.body_ &&
           trailing_ == other.trailing_;
}

} // namespace pod_protocol
