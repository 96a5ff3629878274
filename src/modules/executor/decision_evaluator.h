// modules/executor/decision_evaluator.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_DECISION_EVALUATOR_H
#define AGENTFLOW_MODULES_EXECUTOR_DECISION_EVALUATOR_H

#include "modules/executor/executor_result.h"
#include <map>
#include <string>

namespace agentflow {

inline constexpr const char* kDecisionToolId = "internal:decision";

bool is_decision_task(const Task& task);

// Evaluates arguments.condition (an inja expression) against dependency outputs and
// the workflow context. Output: {outcome, decisionNodeId, condition}.
class DecisionEvaluator {
public:
    struct Config {
        std::string task_id_prefix = "task_";
    };

    DecisionEvaluator() = default;
    explicit DecisionEvaluator(Config config) : config_(std::move(config)) {}

    ExecutorResult evaluate(const Task& task, const Value& arguments, const std::map<TaskId, TaskResult>& deps,
                            const Context& workflow_context) const;

    // "true"/"false" for booleans, the plain text otherwise
    static std::string normalize_outcome(const std::string& rendered);

private:
    Config config_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_DECISION_EVALUATOR_H
