// examples/workflow_demo/main.cpp
#include "agentflow/core/engine.h"
#include "common/utils/logger.h"
#include "common/utils/template_renderer.h"
#include "modules/converter/structure_converter.h"
#include <chrono>
#include <iostream>

using namespace agentflow;

// 演示用沙箱: 代码按 inja 模板渲染, 结果尽量解析为 JSON
class TemplateSandbox : public SandboxExecutor {
public:
    SandboxResult execute(const std::string& code, const Context& context, const SandboxOptions&) override {
        auto start = std::chrono::steady_clock::now();
        SandboxResult result;
        try {
            std::string rendered = InjaTemplateRenderer::render(code, context);
            result.result = Value::accept(rendered) ? Value::parse(rendered) : Value(rendered);
            result.success = true;
        } catch (const std::exception& e) {
            result.error = SandboxError{"RuntimeError", e.what()};
        }
        result.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        return result;
    }
};

static const char* kStructure = R"({
  "nodes": [
    {"id": "fetch", "type": "task", "tool": "inventory:list_items",
     "arguments": {"warehouse": {"type": "parameter", "parameterName": "warehouse"}}},
    {"id": "prices", "type": "task", "tool": "pricing:quote",
     "arguments": {"currency": {"type": "literal", "value": "EUR"}}},
    {"id": "join", "type": "join"},
    {"id": "big_order", "type": "decision", "condition": "length(task_fetch.items) > 2"},
    {"id": "report", "type": "task", "tool": "reports:render",
     "arguments": {"items": {"type": "reference", "expression": "task_fetch.items"}}},
    {"id": "summary", "type": "task", "tool": "reports:summary"}
  ],
  "edges": [
    {"from": "fetch", "to": "join"},
    {"from": "prices", "to": "join"},
    {"from": "join", "to": "big_order"},
    {"from": "big_order", "to": "report", "type": "conditional", "outcome": "true"},
    {"from": "big_order", "to": "summary", "type": "conditional", "outcome": "false"}
  ]
})";

int main(int argc, char** argv) {
    try {
        std::unique_ptr<WorkflowEngine> engine;
        if (argc > 1) {
            engine = WorkflowEngine::from_config_file(argv[1]);
        } else {
            engine = std::make_unique<WorkflowEngine>();
        }

        engine->set_sandbox(std::make_shared<TemplateSandbox>());
        engine->register_tool_client("inventory", [](const std::string& action, const Value& args) {
            return Value{{"action", action}, {"warehouse", args.value("warehouse", "main")},
                         {"items", Value::array({"bolt", "nut", "washer"})}};
        });
        engine->register_tool_client("pricing", [](const std::string&, const Value& args) {
            return Value{{"currency", args.value("currency", "USD")}, {"total", 12.5}};
        });
        engine->register_tool_client("reports", [](const std::string& action, const Value& args) {
            return Value{{"report", action}, {"lines", args.value("items", Value::array()).size()}};
        });
        engine->trace().set_listener([](const TraceRecord& record) {
            Logger::debug("trace", trace_record_to_json(record).dump());
        });

        StructureConverter converter(ConverterOptions{true, "task_"});
        DAGStructure dag = converter.convert(static_structure_from_json(Value::parse(kStructure)));

        // 追加一个代码任务: 汇总 report / summary 之外的结果
        Task totals = Task::make_code("task_totals", R"({"items": {{ length(deps.task_fetch.output.items) }}})",
                                      {"task_fetch", "task_prices"});
        dag.add_tasks({totals});

        ExecuteOptions options;
        options.intent = "Prepare the weekly inventory report";
        options.per_layer_validation = true;
        options.context = Value{{"warehouse", "north"}};

        WorkflowRun run = engine->execute(dag, options);
        while (run.status == WorkflowStatus::PAUSED_FOR_APPROVAL) {
            std::cout << run.summary << "\n\n";
            run = engine->approve(run.workflow_id, run.checkpoint_id.value_or(""), true, "looks good");
        }

        std::cout << workflow_run_to_json(run).dump(2) << std::endl;
        return run.status == WorkflowStatus::COMPLETE ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "workflow_demo: " << e.what() << std::endl;
        return 1;
    }
}
