#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <QString>
#include <optional>
#include <vector>

namespace voxlink::protocol {

struct FrequencyStats {
    double fundamental_frequency = 0.0;
    double spectral_centroid = 0.0;
    double spectral_bandwidth = 0.0;
    double spectral_rolloff = 0.0;
};

struct RecognitionFeatures {
    std::vector<double> mfcc_features;
    double energy_level = 0.0;
    bool voice_activity = false;
    std::optional<FrequencyStats> frequency_stats;
};

/**
 * RecognitionResult - payload of a `recognition_result` message.
 */
struct RecognitionResult {
    QString speaker_id;
    QString speaker_name;
    double confidence = 0.0;       // 0-100
    Timestamp timestamp;
    double audio_duration = 0.0;   // seconds
    double processing_time = 0.0;  // seconds
    std::optional<RecognitionFeatures> features;
};

/**
 * Decode the `data` member of a recognition_result envelope. Accepts the
 * object itself or a string holding its JSON text. Numeric fields that are
 * absent default to zero; a field present with the wrong type is an error.
 */
[[nodiscard]] Result<RecognitionResult> decode_recognition_result(const QJsonValue& data);

[[nodiscard]] QJsonObject to_json(const RecognitionResult& result);

} // namespace voxlink::protocol

Q_DECLARE_METATYPE(voxlink::protocol::RecognitionResult)
