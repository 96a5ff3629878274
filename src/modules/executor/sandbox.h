// modules/executor/sandbox.h
#ifndef AGENTFLOW_MODULES_EXECUTOR_SANDBOX_H
#define AGENTFLOW_MODULES_EXECUTOR_SANDBOX_H

#include "core/types/context.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct SandboxOptions {
    int64_t timeout_ms = 30000;
    int64_t memory_limit_mb = 512;
    std::vector<std::string> allowed_read_paths;
    std::string permission_set = "minimal";
};

struct SandboxError {
    std::string type;    // e.g. "TimeoutError", "RuntimeError"
    std::string message;
};

struct SandboxResult {
    bool success = false;
    Value result;
    std::optional<SandboxError> error;
    double elapsed_ms = 0.0;
};

// 外部协作者: 代码沙箱. Implementations own their timeout enforcement.
class SandboxExecutor {
public:
    virtual ~SandboxExecutor() = default;
    virtual SandboxResult execute(const std::string& code, const Context& context, const SandboxOptions& options) = 0;
};

struct CapabilityRecord {
    std::string id;
    std::string code_snippet;
    std::string permission_set = "minimal";
};

// 外部协作者: 能力存储
class CapabilityStore {
public:
    virtual ~CapabilityStore() = default;
    virtual std::optional<CapabilityRecord> find_by_id(const std::string& id) = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXECUTOR_SANDBOX_H
