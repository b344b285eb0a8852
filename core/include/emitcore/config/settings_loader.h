#pragma once

#include <string>

#include "emitcore/v1/settings.pb.h"

namespace emitcore::config {

// ------------------------------------------------------------
// Host settings loading
// ------------------------------------------------------------
// Settings are plain protobuf messages. YAML is converted to JSON
// text first so both formats share protobuf's JSON mapping and
// validation. Unknown fields are rejected.
//
// All functions return false and fill `error` (if given) on failure;
// `out` is left untouched in that case.
//

bool ParseSettingsJson(const std::string& json, emitcore::v1::HostSettings& out,
                       std::string* error = nullptr);

bool ParseSettingsYaml(const std::string& yaml, emitcore::v1::HostSettings& out,
                       std::string* error = nullptr);

// Dispatch on extension: .yaml / .yml / .json
bool LoadSettingsFile(const std::string& path, emitcore::v1::HostSettings& out,
                      std::string* error = nullptr);

}  // namespace emitcore::config
