#pragma once

#include "core/result.hpp"
#include "network/address_space.hpp"

#include <QString>
#include <QStringList>
#include <chrono>
#include <cstdint>
#include <vector>

namespace voxlink::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

// Longest --duration a single-shot QTimer can hold.
inline constexpr std::chrono::seconds kMaxListenDuration = std::chrono::hours(24 * 24);

/**
 * Parse repeated --subnet values ("10.0.0.0/24"). The first invalid
 * value fails the whole list with ErrorKind::InvalidArgument.
 */
[[nodiscard]] Result<std::vector<network::Subnet>> parse_subnet_options(const QStringList& values);

// 1..65535
[[nodiscard]] Result<uint16_t> parse_port_option(const QString& value);

// Whole seconds in [0, kMaxListenDuration]; 0 means "until the link is lost".
[[nodiscard]] Result<std::chrono::seconds> parse_duration_option(const QString& value);

} // namespace voxlink::cli
