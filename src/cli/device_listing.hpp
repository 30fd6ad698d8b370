#pragma once

#include "network/device.hpp"
#include "protocol/recognition_result.hpp"

#include <QString>
#include <vector>

namespace voxlink::cli {

// One line per device: "<name>  <address>:<port>  [<mac>]  [<model> <version>]".
[[nodiscard]] QString format_device_line(const network::Device& device);

[[nodiscard]] QString format_device_list(const std::vector<network::Device>& devices);

// JSON output:
// {
//   "devices": [{ "name", "address", "port", "hostname"?, "mac"?,
//                 "lastSeen", "capabilities"? { "name", "version", "model", "serial" } }]
// }
[[nodiscard]] QString format_device_list_json(const std::vector<network::Device>& devices);

[[nodiscard]] QString format_recognition_line(const protocol::RecognitionResult& result);

} // namespace voxlink::cli
