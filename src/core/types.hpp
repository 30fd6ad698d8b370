#pragma once

#include <QDateTime>
#include <QString>
#include <chrono>
#include <cstdint>
#include <compare>

namespace voxlink {

/**
 * Timestamp - A point in wall-clock time.
 *
 * Stored as milliseconds since the Unix epoch. Used for Device::last_seen
 * and for heartbeat bookkeeping.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(QDateTime::currentMSecsSinceEpoch());
    }

    [[nodiscard]] static Timestamp from_date_time(const QDateTime& dt) {
        return dt.isValid() ? Timestamp(dt.toMSecsSinceEpoch()) : Timestamp{};
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * True for the default-constructed epoch value, which marks "never".
     */
    [[nodiscard]] constexpr bool is_null() const noexcept {
        return millis_ == 0;
    }

    [[nodiscard]] QDateTime to_date_time() const {
        return QDateTime::fromMSecsSinceEpoch(millis_).toUTC();
    }

    /**
     * Format as ISO 8601 with milliseconds, UTC ("2024-05-01T10:00:00.000Z").
     */
    [[nodiscard]] QString to_iso_string() const {
        return to_date_time().toString(Qt::ISODateWithMs);
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace voxlink
