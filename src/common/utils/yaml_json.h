// common/utils/yaml_json.h
#ifndef RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H
#define RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace researchflow {

// 将 YAML::Node 转换为 nlohmann::json
// Scalars become bool/int/double/null where they parse as such, else string.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML document. Throws ConfigError on unreadable file or bad syntax.
nlohmann::json load_yaml_file(const std::string& path);
nlohmann::json parse_yaml_string(const std::string& text);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_YAML_JSON_H
