// common/utils/yaml_json.h
#ifndef AGENTFLOW_COMMON_UTILS_YAML_JSON_H
#define AGENTFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentflow {

// 将 YAML::Node 转换为 nlohmann::json
// Quoted scalars stay strings; plain scalars are typed (bool / null / integer / float).
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML (or JSON, a YAML subset) document. Throws std::runtime_error on malformed input.
nlohmann::json parse_yaml_document(const std::string& text);
nlohmann::json load_yaml_file(const std::string& path);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_YAML_JSON_H
