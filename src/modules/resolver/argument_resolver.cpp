// modules/resolver/argument_resolver.cpp
#include "modules/resolver/argument_resolver.h"
#include "common/utils/logger.h"
#include <cctype>

namespace agentflow {

namespace {

const std::string kOutputPrefix = "$OUTPUT[";

std::optional<Value> resolve_parameter(const std::string& name, const Context& context) {
    if (name.empty() || !context.is_object()) return std::nullopt;
    if (context.contains("parameters") && context["parameters"].is_object() &&
        context["parameters"].contains(name)) {
        return context["parameters"][name];
    }
    if (context.contains(name)) return context[name];
    return std::nullopt;
}

bool is_index(const std::string& part) {
    if (part.empty()) return false;
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// "$OUTPUT[task_a].data.count" -> {"task_a", ["data", "count"]}
std::optional<std::pair<TaskId, std::vector<std::string>>> parse_output_reference(const std::string& text) {
    if (text.rfind(kOutputPrefix, 0) != 0) return std::nullopt;
    auto close = text.find(']', kOutputPrefix.size());
    if (close == std::string::npos) return std::nullopt;
    TaskId id = text.substr(kOutputPrefix.size(), close - kOutputPrefix.size());
    std::vector<std::string> path;
    if (close + 1 < text.size()) {
        path = ArgumentResolver::parse_expression(text.substr(close + 1));
    }
    return std::make_pair(std::move(id), std::move(path));
}

bool substitute_outputs(Value& node, const ResultMap& results, std::string& error) {
    if (node.is_string()) {
        auto ref = parse_output_reference(node.get<std::string>());
        if (!ref) return true;
        auto it = results.find(ref->first);
        if (it == results.end() || !it->second.output) {
            error = "Referenced task " + ref->first + " has no output";
            return false;
        }
        auto value = ArgumentResolver::navigate_path(*it->second.output, ref->second);
        if (!value) {
            error = "Output path not found in " + node.get<std::string>();
            return false;
        }
        node = std::move(*value);
        return true;
    }
    if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            if (!substitute_outputs(child, results, error)) return false;
        }
    }
    return true;
}

} // namespace

Value ArgumentResolver::resolve_arguments(const ArgumentsStructure& args, const Context& context,
                                          const ResultMap& results) const {
    Value resolved = Value::object();
    for (const auto& [key, arg] : args) {
        std::optional<Value> value;
        switch (arg.type) {
            case ArgumentValue::Type::LITERAL:
                value = arg.value;
                break;
            case ArgumentValue::Type::PARAMETER:
                value = resolve_parameter(arg.parameter_name, context);
                break;
            case ArgumentValue::Type::REFERENCE:
                value = resolve_reference(arg.expression, context, results);
                break;
        }
        if (value) {
            resolved[key] = std::move(*value);
        } else {
            Logger::warning("argument_resolver", "Failed to resolve argument '" + key + "'");
        }
    }
    return resolved;
}

std::optional<Value> ArgumentResolver::resolve_reference(const std::string& expression, const Context& context,
                                                         const ResultMap& results) const {
    auto parts = parse_expression(expression);
    if (parts.empty()) return std::nullopt;
    const std::string root = parts.front();
    std::vector<std::string> path(parts.begin() + 1, parts.end());

    for (const auto& candidate : {config_.task_id_prefix + root, root}) {
        auto it = results.find(candidate);
        if (it != results.end() && it->second.succeeded() && it->second.output) {
            return navigate_path(*it->second.output, path);
        }
    }
    if (context.is_object() && context.contains(root)) {
        return navigate_path(context[root], path);
    }
    Logger::debug("argument_resolver", "Reference '" + expression + "' not resolved");
    return std::nullopt;
}

OutputReferenceResolution ArgumentResolver::resolve_output_references(const Value& arguments, const ResultMap& results) {
    OutputReferenceResolution resolution;
    resolution.arguments = arguments;
    if (!substitute_outputs(resolution.arguments, results, resolution.error)) {
        return resolution;
    }
    resolution.success = true;
    return resolution;
}

Value ArgumentResolver::merge_arguments(const Value& resolved, const Value& explicit_args) {
    Value merged = resolved.is_object() ? resolved : Value::object();
    if (explicit_args.is_object()) {
        for (auto it = explicit_args.begin(); it != explicit_args.end(); ++it) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

std::vector<std::string> ArgumentResolver::parse_expression(const std::string& expression) {
    std::string cleaned = expression;
    if (cleaned.size() >= 2 && cleaned.front() == '`' && cleaned.back() == '`') {
        cleaned = cleaned.substr(1, cleaned.size() - 2);
    }

    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < cleaned.size(); ++i) {
        char c = cleaned[i];
        if (c == '.') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else if (c == '[') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
            auto close = cleaned.find(']', i);
            if (close != std::string::npos && close > i) {
                std::string index = cleaned.substr(i + 1, close - i - 1);
                if (index.size() >= 2 && (index.front() == '\'' || index.front() == '"') && index.back() == index.front()) {
                    index = index.substr(1, index.size() - 2);
                }
                parts.push_back(std::move(index));
                i = close;
            }
        } else if (c != ']') {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

std::optional<Value> ArgumentResolver::navigate_path(const Value& root, const std::vector<std::string>& path) {
    const Value* current = &root;
    for (const auto& part : path) {
        if (current->is_array()) {
            if (!is_index(part)) return std::nullopt;
            size_t index = std::stoul(part);
            if (index >= current->size()) return std::nullopt;
            current = &(*current)[index];
        } else if (current->is_object()) {
            auto it = current->find(part);
            if (it == current->end()) return std::nullopt;
            current = &(*it);
        } else {
            return std::nullopt;
        }
    }
    return *current;
}

} // namespace agentflow
