#include "protocol/recognition_result.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>

namespace voxlink::protocol {
namespace {

Error type_error(const char* field) {
    return Error{std::string("field '") + field + "' has the wrong type", ErrorKind::Decode};
}

// Optional typed field readers: absent or null keeps the default, wrong
// type reports the field name.
std::optional<Error> read_number(const QJsonObject& obj, const char* key, double& out) {
    const auto v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isDouble()) return type_error(key);
    out = v.toDouble();
    return std::nullopt;
}

std::optional<Error> read_string(const QJsonObject& obj, const char* key, QString& out) {
    const auto v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isString()) return type_error(key);
    out = v.toString();
    return std::nullopt;
}

std::optional<Error> read_bool(const QJsonObject& obj, const char* key, bool& out) {
    const auto v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (!v.isBool()) return type_error(key);
    out = v.toBool();
    return std::nullopt;
}

Result<FrequencyStats> decode_frequency_stats(const QJsonObject& obj) {
    FrequencyStats stats;
    for (auto err : {read_number(obj, "fundamental_frequency", stats.fundamental_frequency),
                     read_number(obj, "spectral_centroid", stats.spectral_centroid),
                     read_number(obj, "spectral_bandwidth", stats.spectral_bandwidth),
                     read_number(obj, "spectral_rolloff", stats.spectral_rolloff)}) {
        if (err) return Result<FrequencyStats>::err(*err);
    }
    return Result<FrequencyStats>::ok(stats);
}

Result<RecognitionFeatures> decode_features(const QJsonObject& obj) {
    RecognitionFeatures features;

    const auto mfcc = obj.value(QStringLiteral("mfcc_features"));
    if (mfcc.isArray()) {
        for (const auto& v : mfcc.toArray()) {
            if (!v.isDouble()) {
                return Result<RecognitionFeatures>::err(type_error("mfcc_features"));
            }
            features.mfcc_features.push_back(v.toDouble());
        }
    } else if (!mfcc.isUndefined() && !mfcc.isNull()) {
        return Result<RecognitionFeatures>::err(type_error("mfcc_features"));
    }

    if (auto err = read_number(obj, "energy_level", features.energy_level)) {
        return Result<RecognitionFeatures>::err(*err);
    }
    if (auto err = read_bool(obj, "voice_activity", features.voice_activity)) {
        return Result<RecognitionFeatures>::err(*err);
    }

    const auto stats = obj.value(QStringLiteral("frequency_stats"));
    if (stats.isObject()) {
        auto decoded = decode_frequency_stats(stats.toObject());
        if (decoded.is_err()) {
            return Result<RecognitionFeatures>::err(decoded.unwrap_err());
        }
        features.frequency_stats = decoded.unwrap();
    } else if (!stats.isUndefined() && !stats.isNull()) {
        return Result<RecognitionFeatures>::err(type_error("frequency_stats"));
    }

    return Result<RecognitionFeatures>::ok(std::move(features));
}

} // namespace

Result<RecognitionResult> decode_recognition_result(const QJsonValue& data) {
    QJsonObject obj;
    if (data.isObject()) {
        obj = data.toObject();
    } else if (data.isString()) {
        const auto doc = QJsonDocument::fromJson(data.toString().toUtf8());
        if (!doc.isObject()) {
            return Result<RecognitionResult>::err(
                Error{"recognition result is not an object", ErrorKind::Decode});
        }
        obj = doc.object();
    } else {
        return Result<RecognitionResult>::err(
            Error{"recognition result is not an object", ErrorKind::Decode});
    }

    RecognitionResult result;
    for (auto err : {read_string(obj, "speaker_id", result.speaker_id),
                     read_string(obj, "speaker_name", result.speaker_name),
                     read_number(obj, "confidence", result.confidence),
                     read_number(obj, "audio_duration", result.audio_duration),
                     read_number(obj, "processing_time", result.processing_time)}) {
        if (err) return Result<RecognitionResult>::err(*err);
    }

    QString ts;
    if (auto err = read_string(obj, "timestamp", ts)) {
        return Result<RecognitionResult>::err(*err);
    }
    if (!ts.isEmpty()) {
        result.timestamp = Timestamp::from_date_time(QDateTime::fromString(ts, Qt::ISODateWithMs));
    }

    const auto features = obj.value(QStringLiteral("features"));
    if (features.isObject()) {
        auto decoded = decode_features(features.toObject());
        if (decoded.is_err()) {
            return Result<RecognitionResult>::err(decoded.unwrap_err());
        }
        result.features = std::move(decoded).unwrap();
    } else if (!features.isUndefined() && !features.isNull()) {
        return Result<RecognitionResult>::err(type_error("features"));
    }

    return Result<RecognitionResult>::ok(std::move(result));
}

QJsonObject to_json(const RecognitionResult& result) {
    QJsonObject obj;
    obj["speaker_id"] = result.speaker_id;
    obj["speaker_name"] = result.speaker_name;
    obj["confidence"] = result.confidence;
    obj["timestamp"] = result.timestamp.to_iso_string();
    obj["audio_duration"] = result.audio_duration;
    obj["processing_time"] = result.processing_time;

    if (result.features) {
        const auto& f = *result.features;
        QJsonArray mfcc;
        for (double v : f.mfcc_features) {
            mfcc.append(v);
        }
        QJsonObject features;
        features["mfcc_features"] = mfcc;
        features["energy_level"] = f.energy_level;
        features["voice_activity"] = f.voice_activity;
        if (f.frequency_stats) {
            QJsonObject stats;
            stats["fundamental_frequency"] = f.frequency_stats->fundamental_frequency;
            stats["spectral_centroid"] = f.frequency_stats->spectral_centroid;
            stats["spectral_bandwidth"] = f.frequency_stats->spectral_bandwidth;
            stats["spectral_rolloff"] = f.frequency_stats->spectral_rolloff;
            features["frequency_stats"] = stats;
        }
        obj["features"] = features;
    }
    return obj;
}

} // namespace voxlink::protocol
