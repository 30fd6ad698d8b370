#include "protocol/message_codec.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>

namespace voxlink::protocol {
namespace {

Timestamp parse_timestamp(const QJsonValue& value) {
    if (!value.isString()) {
        return Timestamp{};
    }
    auto dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value.toString(), Qt::ISODate);
    }
    return Timestamp::from_date_time(dt);
}

} // namespace

MessageKind Message::kind() const {
    return message_kind(type);
}

MessageKind message_kind(const QString& type) {
    const auto t = type.trimmed().toLower();
    if (t == QLatin1String(kTypePing)) return MessageKind::Ping;
    if (t == QLatin1String(kTypePong)) return MessageKind::Pong;
    if (t == QLatin1String(kTypeRecognitionResult)) return MessageKind::RecognitionResult;
    if (t == QLatin1String(kTypeError)) return MessageKind::Error;
    return MessageKind::Unknown;
}

QByteArray encode_message(const Message& message) {
    QJsonObject obj;
    obj["type"] = message.type;
    if (!message.data.isNull() && !message.data.isUndefined()) {
        obj["data"] = message.data;
    }
    const auto ts = message.timestamp.is_null() ? Timestamp::now() : message.timestamp;
    obj["timestamp"] = ts.to_iso_string();
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<Message> decode_message(const QByteArray& frame) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(frame, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<Message>::err(
            Error{"invalid json: " + err.errorString().toStdString(), ErrorKind::Decode});
    }
    if (!doc.isObject()) {
        return Result<Message>::err(Error{"envelope is not an object", ErrorKind::Decode});
    }

    const auto obj = doc.object();
    const auto type = obj.value(QStringLiteral("type"));
    if (!type.isString() || type.toString().trimmed().isEmpty()) {
        return Result<Message>::err(Error{"missing message type", ErrorKind::Decode});
    }

    Message msg;
    msg.type = type.toString().trimmed();
    msg.data = obj.value(QStringLiteral("data"));
    if (msg.data.isUndefined()) {
        msg.data = QJsonValue(QJsonValue::Null);
    }
    msg.timestamp = parse_timestamp(obj.value(QStringLiteral("timestamp")));
    return Result<Message>::ok(std::move(msg));
}

Message make_ping() {
    return Message{QString::fromLatin1(kTypePing), QJsonValue(QJsonValue::Null), Timestamp::now()};
}

Message make_pong() {
    return Message{QString::fromLatin1(kTypePong), QJsonValue(QJsonValue::Null), Timestamp::now()};
}

QString error_text(const QJsonValue& data) {
    if (data.isString() && !data.toString().isEmpty()) {
        return data.toString();
    }
    if (data.isObject()) {
        const auto obj = data.toObject();
        for (const auto* key : {"message", "detail", "error"}) {
            const auto v = obj.value(QLatin1String(key));
            if (v.isString() && !v.toString().isEmpty()) {
                return v.toString();
            }
        }
        return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
    }
    return QStringLiteral("Unknown error");
}

} // namespace voxlink::protocol
