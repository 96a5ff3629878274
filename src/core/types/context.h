// core/types/context.h
#ifndef AGENTFLOW_CORE_TYPES_CONTEXT_H
#define AGENTFLOW_CORE_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace agentflow {

// 使用 nlohmann::json 作为统一的数据类型 (任务参数 / 输出 / 工作流上下文)
using Value = nlohmann::json;
using Context = nlohmann::json;

using TaskId = std::string;
using WorkflowId = std::string;

using TimePoint = std::chrono::system_clock::time_point;

// ISO-8601 UTC, millisecond precision
std::string format_timestamp(TimePoint tp);
TimePoint parse_timestamp(const std::string& text);
inline TimePoint now() { return std::chrono::system_clock::now(); }
int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_CONTEXT_H
