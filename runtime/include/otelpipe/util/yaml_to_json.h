#pragma once

#include <yaml-cpp/yaml.h>

#include <ostream>
#include <string>
#include <string_view>

/*
 * Minimal YAML → JSON emitter.
 *
 * Purpose:
 *   - Convert YAML syntax into JSON text
 *   - Let the protobuf JSON parser handle schema + validation
 *
 * Supported:
 *   - maps
 *   - sequences
 *   - scalars
 *   - null
 *
 * NOTE:
 *   Scalars are emitted as JSON strings, which the protobuf JSON parser
 *   accepts for numbers and enums. Unquoted true/false are emitted as
 *   JSON booleans so they map onto bool fields.
 */

namespace otelpipe::util {

inline void yaml_to_json(const YAML::Node& node, std::ostream& out);

inline void json_string(std::string_view text, std::ostream& out) {
  static constexpr char kHex[] = "0123456789abcdef";

  out << '"';
  for (const char c : text) {
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
          out << "\\u00" << kHex[(c >> 4) & 0xf] << kHex[c & 0xf];
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

    json_string(it.first.as<std::string>(), out);
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
  const std::string& value = node.Scalar();

  // Plain (unquoted) scalars carry the "?" tag
  if (node.Tag() == "?" && (value == "true" || value == "false")) {
    out << value;
    return;
  }
  json_string(value, out);
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

}  // namespace otelpipe::util
