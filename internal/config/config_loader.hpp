#pragma once

#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace livetv::config {

// Malformed YAML, an unknown field, or a value of the wrong type. The
// message names the source (file path or "<string>") and, for YAML syntax
// errors, the line and column.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/*
  Reads the broker's RuntimeConfig from YAML.

  The document is turned into a google.protobuf.Value tree, printed as
  JSON and parsed with the protobuf JSON parser, so the YAML keys are the
  proto field names and durations use the "90s" form. Quoted scalars stay
  strings; integers too large for a double are passed as JSON strings,
  which the parser accepts for 64-bit fields.
*/
class ConfigLoader {
 public:
  static livetv::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static livetv::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace livetv::config
