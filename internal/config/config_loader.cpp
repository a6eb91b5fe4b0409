#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <functional>

namespace livetv::config {

namespace {

using livetv::runtime::config::RuntimeConfig;
using google::protobuf::Value;

constexpr long long kMaxExactDouble = 1LL << 53;

bool IsIntegerText(const std::string& text) {
  size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
  if (start == text.size()) return false;
  for (size_t i = start; i < text.size(); ++i) {
    if (text[i] < '0' || text[i] > '9') return false;
  }
  return true;
}

void ConvertScalar(const YAML::Node& node, Value* out) {
  const std::string& text = node.Scalar();

  // "!" is the tag yaml-cpp gives quoted scalars
  if (node.Tag() == "!" || text.empty()) {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (IsIntegerText(text)) {
    errno            = 0;
    const long long n = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE || n > kMaxExactDouble || n < -kMaxExactDouble) {
      out->set_string_value(text);
    } else {
      out->set_number_value(static_cast<double>(n));
    }
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    out->set_number_value(number);
  } else {
    out->set_string_value(text);
  }
}

void Convert(const YAML::Node& node, Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) Convert(item, list->add_values());
      return;
    }
    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) Convert(entry.second, &fields[entry.first.Scalar()]);
      return;
    }
  }
}

RuntimeConfig Load(const std::string& source, const std::function<YAML::Node()>& read) {
  YAML::Node document;
  try {
    document = read();
  } catch (const YAML::BadFile&) {
    throw ConfigError(source + ": cannot open config file");
  } catch (const YAML::Exception& e) {
    throw ConfigError(source + ":" + std::to_string(e.mark.line + 1) + ":" + std::to_string(e.mark.column + 1) + ": " + e.msg);
  }

  Value root;
  if (document.IsNull()) {
    root.mutable_struct_value();
  } else if (document.IsMap()) {
    Convert(document, &root);
  } else {
    throw ConfigError(source + ": top level of the config must be a mapping");
  }

  std::string json;
  auto        printed = google::protobuf::util::MessageToJsonString(root, &json);
  if (!printed.ok()) {
    throw ConfigError(source + ": " + std::string(printed.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  auto          parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw ConfigError(source + ": invalid configuration: " + std::string(parsed.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  return Load(path, [&path] { return YAML::LoadFile(path); });
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  return Load("<string>", [&yaml] { return YAML::Load(yaml); });
}

} // namespace livetv::config
