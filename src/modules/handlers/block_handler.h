// modules/handlers/block_handler.h
#ifndef BLOCKFLOW_MODULES_HANDLERS_BLOCK_HANDLER_H
#define BLOCKFLOW_MODULES_HANDLERS_BLOCK_HANDLER_H

#include "core/types/block.h"
#include "core/types/context.h"
#include "common/tools/cancellation.h"
#include "common/tools/registry.h"
#include "modules/context/execution_context.h"
#include <string>

namespace blockflow {

// Executes one block kind. Handlers are shared by all workers of a run, so
// execute() must not keep per-call state in members.
class BlockHandler {
public:
    virtual ~BlockHandler() = default;

    virtual const char* name() const = 0;
    virtual bool can_handle(const Block& block) const = 0;

    // Returns the block's output. Throws ExecutionError subclasses on failure.
    virtual Value execute(const Block& block,
                          const Value& inputs,
                          ExecutionContext& ctx,
                          const CancellationToken& cancel) = 0;
};

// Base for handlers that delegate to an external tool
class ToolBackedHandler : public BlockHandler {
protected:
    explicit ToolBackedHandler(ToolInvoker& tools) : tools_(tools) {}

    // Invokes `tool_name` and waits for the envelope. A failed envelope becomes
    // ToolInvocationError carrying the tool's message, else `fallback_message`.
    Value call_tool(const std::string& tool_name,
                    const Value& params,
                    long long timeout_ms,
                    const CancellationToken& cancel,
                    const std::string& fallback_message);

    // Milliseconds from a JSON timeout, clamped to [0, kMaxToolTimeoutMs];
    // `fallback` when the value is not a number
    static long long timeout_ms_from(const Value& timeout, long long fallback);

    ToolInvoker& tools_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_HANDLERS_BLOCK_HANDLER_H
