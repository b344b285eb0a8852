#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <ostream>
#include <string>

/*
 * YAML → JSON emitter for protobuf-backed settings.
 *
 * Purpose:
 *   - Convert YAML syntax into JSON text
 *   - Let the protobuf JSON parser handle schema + validation
 *
 * Scalars:
 *   - quoted scalars are always strings
 *   - plain true/false become JSON booleans (protobuf rejects "true")
 *     other YAML 1.1 booleans (yes/no/on/off) stay strings
 *   - plain numbers are emitted unquoted
 *   - everything else is an escaped JSON string
 */

namespace emitcore::util {

inline void yaml_to_json(const YAML::Node& node, std::ostream& out);

inline void json_escape(const std::string& s, std::ostream& out) {
  out << '"';
  for (char c : s) {
    switch (c) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out << buf;
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

inline void yaml_map_to_json(const YAML::Node& node, std::ostream& out) {
  out << "{";
  bool first = true;
  for (const auto& it : node) {
    if (!first)
      out << ",";
    first = false;

    json_escape(it.first.as<std::string>(), out);
    out << ":";

    yaml_to_json(it.second, out);
  }
  out << "}";
}

inline void yaml_seq_to_json(const YAML::Node& node, std::ostream& out) {
  out << "[";
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (i > 0)
      out << ",";
    yaml_to_json(node[i], out);
  }
  out << "]";
}

inline void yaml_scalar_to_json(const YAML::Node& node, std::ostream& out) {
  const std::string& text = node.Scalar();

  // Non-plain ("!") tag means the scalar was quoted in the source
  if (node.Tag() != "!") {
    // Only the JSON literals: "off" / "yes" stay strings
    if (text == "true" || text == "false") {
      out << text;
      return;
    }
    double d = 0;
    if (YAML::convert<double>::decode(node, d) && !text.empty() &&
        text.find_first_not_of("0123456789+-.eE") == std::string::npos) {
      out << text;
      return;
    }
  }

  json_escape(text, out);
}

inline void yaml_to_json(const YAML::Node& node, std::ostream& out) {
  switch (node.Type()) {
    case YAML::NodeType::Map:
      yaml_map_to_json(node, out);
      break;

    case YAML::NodeType::Sequence:
      yaml_seq_to_json(node, out);
      break;

    case YAML::NodeType::Scalar:
      yaml_scalar_to_json(node, out);
      break;

    case YAML::NodeType::Null:
    default:
      out << "null";
      break;
  }
}

}  // namespace emitcore::util
