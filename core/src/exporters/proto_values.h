#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/nostd/variant.h>
#include <opentelemetry/sdk/common/attribute_utils.h>
#include <opentelemetry/sdk/instrumentationscope/instrumentation_scope.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/trace/span_id.h>
#include <opentelemetry/trace/trace_id.h>

/*
 * OpenTelemetry attribute values → google.protobuf.Value.
 *
 * Used by the file exporters to build records that protobuf's
 * JSON printer turns into one line each.
 *
 *   bool            → bool_value
 *   integers/double → number_value
 *   strings         → string_value
 *   arrays          → list_value of the above
 */

namespace emitcore::exporters::detail {

template <typename T>
struct IsSequence : std::false_type {};
template <typename T, typename A>
struct IsSequence<std::vector<T, A>> : std::true_type {};
template <typename T, std::size_t N>
struct IsSequence<opentelemetry::nostd::span<T, N>> : std::true_type {};

template <typename T>
inline void SetScalar(const T& v, google::protobuf::Value* out) {
  if constexpr (std::is_same_v<T, bool>) {
    out->set_bool_value(v);
  } else if constexpr (std::is_arithmetic_v<T>) {
    out->set_number_value(static_cast<double>(v));
  } else if constexpr (std::is_same_v<T, const char*>) {
    out->set_string_value(v ? v : "");
  } else {
    out->set_string_value(std::string(v.data(), v.size()));
  }
}

struct ValueBuilder {
  google::protobuf::Value* out;

  template <typename T>
  void operator()(const T& v) const {
    if constexpr (IsSequence<T>::value) {
      using Item = std::decay_t<decltype(*std::begin(v))>;
      auto* list = out->mutable_list_value();
      for (const auto& item : v) {
        SetScalar<Item>(item, list->add_values());
      }
    } else {
      SetScalar(v, out);
    }
  }
};

inline void SetValue(const opentelemetry::common::AttributeValue& value,
                     google::protobuf::Value* out) {
  opentelemetry::nostd::visit(ValueBuilder{out}, value);
}

inline void SetValue(const opentelemetry::sdk::common::OwnedAttributeValue& value,
                     google::protobuf::Value* out) {
  opentelemetry::nostd::visit(ValueBuilder{out}, value);
}

// Copy an attribute map (any map of string → OwnedAttributeValue).
template <typename Map>
inline void FillStruct(const Map& attributes, google::protobuf::Struct* out) {
  auto& fields = *out->mutable_fields();
  for (const auto& [key, value] : attributes) {
    SetValue(value, &fields[std::string(key)]);
  }
}

inline void FillResource(const opentelemetry::sdk::resource::Resource& resource,
                         google::protobuf::Struct* out) {
  FillStruct(resource.GetAttributes(), out);
}

inline std::string ScopeName(
    const opentelemetry::sdk::instrumentationscope::InstrumentationScope& scope) {
  std::string name = scope.GetName();
  if (!scope.GetVersion().empty()) {
    name += "@" + scope.GetVersion();
  }
  return name;
}

inline std::string Hex(const opentelemetry::trace::TraceId& id) {
  char buf[opentelemetry::trace::TraceId::kSize * 2];
  id.ToLowerBase16(buf);
  return std::string(buf, sizeof(buf));
}

inline std::string Hex(const opentelemetry::trace::SpanId& id) {
  char buf[opentelemetry::trace::SpanId::kSize * 2];
  id.ToLowerBase16(buf);
  return std::string(buf, sizeof(buf));
}

inline uint64_t UnixNanos(opentelemetry::common::SystemTimestamp ts) {
  return static_cast<uint64_t>(ts.time_since_epoch().count());
}

}  // namespace emitcore::exporters::detail
