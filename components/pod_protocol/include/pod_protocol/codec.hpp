#pragma once

#include "pod_protocol/message.hpp"
#include "pod_protocol/types.hpp"

namespace pod_protocol {

/**
 * @brief Encode only the body of a message, without trailing bytes
 *
 * Fixed shapes encode to their declared size; log entries, SGEE uploads and
 * raw bodies to their content length.
 */
Bytes encodeBody(const Message& message);

/**
 * @brief Length the command header announces for a message
 */
size_t encodedBodyLength(const Message& message);

/**
 * @brief Serialize a message: command header, body, trailing bytes
 *
 * The body length in the header is recomputed from the body.
 */
Bytes encodeMessage(const Message& message);

/**
 * @brief Decode a reassembled logical message
 *
 * The kind is looked up by (command, direction), then by command alone. An
 * unknown command decodes to MessageKind::UNKNOWN with a raw body. Body
 * bytes are truncated or zero padded to the shape; bytes past the shape
 * are kept as trailing bytes.
 *
 * @throws ParseError if fewer bytes than a command header are given
 */
Message decodeMessage(const uint8_t* data, size_t length);
Message decodeMessage(const Bytes& data);

} // namespace pod_protocol
