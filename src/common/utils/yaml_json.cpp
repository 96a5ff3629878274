// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <stdexcept>
#include <string>

namespace agentflow {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

nlohmann::json typed_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s == "Null" || s.empty()) return nullptr;

    if (is_integer(s)) {
        try {
            return std::stoll(s);
        } catch (const std::out_of_range&) {
            return s; // 超出范围: 保留为字符串
        }
    }
    // float / scientific: require the whole scalar to be consumed
    try {
        size_t consumed = 0;
        double d = std::stod(s, &consumed);
        if (consumed == s.size()) return d;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            // 带引号的标量 tag 为 "!", 不做类型推断
            if (node.Tag() == "!") return node.Scalar();
            return typed_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json parse_yaml_document(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parse error: " + std::string(e.what()));
    }
}

nlohmann::json load_yaml_file(const std::string& path) {
    try {
        return yaml_to_json(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open YAML file: " + path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parse error in " + path + ": " + std::string(e.what()));
    }
}

} // namespace agentflow
