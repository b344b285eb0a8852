#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/nostd/string_view.h>

#include "emitcore/telemetry/attributes.h"

namespace emitcore::telemetry::detail {

using OtelPair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

// ------------------------------------------------------------
// OtelAttributes
// ------------------------------------------------------------
// Non-owning OpenTelemetry view of an Attributes map. The source
// map must outlive this object; the SDK copies values on use.
//
class OtelAttributes {
 public:
  explicit OtelAttributes(const Attributes& attributes) {
    string_arrays_.reserve(attributes.size());
    pairs_.reserve(attributes.size());
    for (const auto& [key, value] : attributes) {
      pairs_.emplace_back(opentelemetry::nostd::string_view(key.data(), key.size()),
                          Convert(value));
    }
  }

  OtelAttributes(const OtelAttributes&) = delete;
  OtelAttributes& operator=(const OtelAttributes&) = delete;

  const std::vector<OtelPair>& pairs() const {
    return pairs_;
  }

  opentelemetry::common::KeyValueIterableView<std::vector<OtelPair>> view() const {
    return opentelemetry::common::KeyValueIterableView<std::vector<OtelPair>>(pairs_);
  }

  // Single value conversion for Span::SetAttribute. `storage`
  // backs string arrays and must outlive the result.
  static opentelemetry::common::AttributeValue Convert(
      const AttributeValue& value, std::vector<opentelemetry::nostd::string_view>& storage) {
    return std::visit(
        [&storage](const auto& v) -> opentelemetry::common::AttributeValue {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            return opentelemetry::nostd::string_view(v.data(), v.size());
          } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            storage.clear();
            for (const auto& s : v) {
              storage.emplace_back(s.data(), s.size());
            }
            return opentelemetry::nostd::span<const opentelemetry::nostd::string_view>(
                storage.data(), storage.size());
          } else {
            return v;
          }
        },
        value);
  }

 private:
  opentelemetry::common::AttributeValue Convert(const AttributeValue& value) {
    string_arrays_.emplace_back();
    return Convert(value, string_arrays_.back());
  }

  // Reserved up front so the inner buffers never move.
  std::vector<std::vector<opentelemetry::nostd::string_view>> string_arrays_;
  std::vector<OtelPair> pairs_;
};

}  // namespace emitcore::telemetry::detail
