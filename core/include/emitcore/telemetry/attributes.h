#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace emitcore::telemetry {

// Value of a span / metric / log attribute.
using AttributeValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

using Attributes = std::map<std::string, AttributeValue>;

// Attribute set where individual entries may be absent. Absent
// entries are skipped, which lets call sites pass optional fields
// without branching.
using OptionalAttributes = std::map<std::string, std::optional<AttributeValue>>;

}  // namespace emitcore::telemetry
