// modules/resolver/argument_resolver.h
#ifndef AGENTFLOW_MODULES_RESOLVER_ARGUMENT_RESOLVER_H
#define AGENTFLOW_MODULES_RESOLVER_ARGUMENT_RESOLVER_H

#include "core/types/context.h"
#include "core/types/task.h"
#include "modules/resolver/dependency_resolver.h" // 引入 ResultMap
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct OutputReferenceResolution {
    bool success = false;
    std::string error;
    Value arguments = Value::object();
};

class ArgumentResolver {
public:
    struct Config {
        std::string task_id_prefix = "task_";
    };

    ArgumentResolver() = default;
    explicit ArgumentResolver(Config config) : config_(std::move(config)) {}

    // literal / parameter / reference strategies. Unresolvable entries are dropped with a warning.
    Value resolve_arguments(const ArgumentsStructure& args, const Context& context, const ResultMap& results) const;

    // Replaces "$OUTPUT[id]" / "$OUTPUT[id].a.b" strings (recursively) with prior task output
    static OutputReferenceResolution resolve_output_references(const Value& arguments, const ResultMap& results);

    // explicit wins on key conflicts
    static Value merge_arguments(const Value& resolved, const Value& explicit_args);

    // "n1.items[0]['name']" -> ["n1", "items", "0", "name"]
    static std::vector<std::string> parse_expression(const std::string& expression);
    static std::optional<Value> navigate_path(const Value& root, const std::vector<std::string>& path);

private:
    std::optional<Value> resolve_reference(const std::string& expression, const Context& context,
                                           const ResultMap& results) const;

    Config config_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_RESOLVER_ARGUMENT_RESOLVER_H
