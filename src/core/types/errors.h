// core/types/errors.h
#ifndef AGENTFLOW_CORE_TYPES_ERRORS_H
#define AGENTFLOW_CORE_TYPES_ERRORS_H

#include <stdexcept>
#include <string>

namespace agentflow {

// 结构性错误: 直接抛给调用方, 不折叠进 TaskResult
struct CycleDetectedError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CheckpointNotFoundError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RecordNotFoundError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InvalidCommandError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing collaborator or invalid engine configuration. Never captured into a TaskResult.
struct ConfigurationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StateInvariantError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConversionError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DagValidationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ToolRoutingError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_ERRORS_H
