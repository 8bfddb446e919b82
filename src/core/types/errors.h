#ifndef BLOCKFLOW_CORE_TYPES_ERRORS_H
#define BLOCKFLOW_CORE_TYPES_ERRORS_H

#include "context.h"
#include <stdexcept>
#include <string>

namespace blockflow {

// Base of every error raised while running a workflow
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A reference names a block without recorded output. Means the scheduler admitted a block too early.
class UnresolvedReferenceError : public ExecutionError {
public:
    UnresolvedReferenceError(const BlockId& block_id, const std::string& reference)
        : ExecutionError("Unresolved reference '" + reference + "': block '" + block_id + "' has no recorded output"),
          block_id_(block_id) {}

    const BlockId& block_id() const { return block_id_; }

private:
    BlockId block_id_;
};

class MissingEnvironmentVariableError : public ExecutionError {
public:
    explicit MissingEnvironmentVariableError(const std::string& name)
        : ExecutionError("Environment variable '" + name + "' is not set"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Tool envelope reported success = false
class ToolInvocationError : public ExecutionError {
public:
    ToolInvocationError(const std::string& tool_name, const std::string& message)
        : ExecutionError(message), tool_name_(tool_name) {}

    const std::string& tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

// Configuration error: no registered handler accepts the block
class HandlerNotFoundError : public ExecutionError {
public:
    HandlerNotFoundError(const BlockId& block_id, const std::string& kind)
        : ExecutionError("No handler found for block '" + block_id + "' of kind '" + kind + "'") {}
};

class TimeoutError : public ExecutionError {
public:
    TimeoutError(const std::string& tool_name, long long timeout_ms)
        : ExecutionError("Tool '" + tool_name + "' timed out after " + std::to_string(timeout_ms) + "ms") {}
};

class CancelledError : public ExecutionError {
public:
    CancelledError() : ExecutionError("Execution cancelled") {}
};

class GraphValidationError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

// Router/condition expression could not be evaluated or selected nothing
class ExpressionError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

} // namespace blockflow

#endif // BLOCKFLOW_CORE_TYPES_ERRORS_H
