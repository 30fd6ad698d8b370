#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QJsonValue>
#include <QString>

namespace voxlink::protocol {

/**
 * Message types understood by the client.
 *
 * Wire values are the lowercase strings below; matching is
 * case-insensitive so "PING" from an older server still counts.
 */
enum class MessageKind {
    Ping,
    Pong,
    RecognitionResult,
    Error,
    Unknown
};

inline constexpr const char* kTypePing = "ping";
inline constexpr const char* kTypePong = "pong";
inline constexpr const char* kTypeRecognitionResult = "recognition_result";
inline constexpr const char* kTypeError = "error";

/**
 * Message - JSON envelope carried in text frames.
 *
 * Format:
 *   { "type": string, "data": any, "timestamp": ISO-8601 string }
 *
 * `type` is always present. `data` is type-dependent and may be null.
 * `timestamp` is the sender's clock; it is null when the sender omitted it
 * or sent something unparseable.
 */
struct Message {
    QString type;
    QJsonValue data;
    Timestamp timestamp;

    [[nodiscard]] MessageKind kind() const;
};

[[nodiscard]] MessageKind message_kind(const QString& type);

/**
 * Serialize a message as compact JSON. A null timestamp is stamped with
 * the current time; null data is omitted.
 */
[[nodiscard]] QByteArray encode_message(const Message& message);

/**
 * Parse a text frame. Fails on invalid JSON, a non-object document, or a
 * missing/empty/non-string `type`.
 */
[[nodiscard]] Result<Message> decode_message(const QByteArray& frame);

[[nodiscard]] Message make_ping();
[[nodiscard]] Message make_pong();

/**
 * Human-readable text for an `error` message payload.
 */
[[nodiscard]] QString error_text(const QJsonValue& data);

} // namespace voxlink::protocol
