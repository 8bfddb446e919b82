// common/tools/registry.h
#ifndef BLOCKFLOW_COMMON_TOOLS_REGISTRY_H
#define BLOCKFLOW_COMMON_TOOLS_REGISTRY_H

#include "core/types/context.h"
#include "common/tools/cancellation.h"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace blockflow {

// Upper bound for any invocation timeout (one day)
constexpr long long kMaxToolTimeoutMs = 24LL * 60 * 60 * 1000;

// { success, output?, error? } as returned by every tool
struct ToolEnvelope {
    bool success = false;
    std::optional<Value> output;
    std::optional<std::string> error;

    static ToolEnvelope ok(Value output) {
        return ToolEnvelope{true, std::move(output), std::nullopt};
    }
    static ToolEnvelope failure(std::optional<std::string> error = std::nullopt) {
        return ToolEnvelope{false, std::nullopt, std::move(error)};
    }
};

using ToolFunction = std::function<ToolEnvelope(const Value& params, const CancellationToken& cancel)>;

// Boundary to external tools. The engine only interprets the envelope.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual bool has_tool(const std::string& name) const = 0;
    virtual std::future<ToolEnvelope> invoke(const std::string& name, const Value& params, CancellationToken cancel) = 0;
};

class ToolRegistry : public ToolInvoker {
public:
    ToolRegistry() = default;

    template<typename Func>
    void register_tool(std::string name, Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_[std::move(name)] = ToolFunction(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const override;

    // Runs the tool on its own thread; a throwing tool yields a failure envelope.
    std::future<ToolEnvelope> invoke(const std::string& name, const Value& params, CancellationToken cancel) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFunction> tools_;
};

// Waits for an invocation, polling the run token. timeout_ms is clamped to
// [0, kMaxToolTimeoutMs]. Throws TimeoutError once it elapses (and cancels `invocation` so the tool
// can stop), CancelledError when `run` is cancelled first.
ToolEnvelope await_envelope(std::future<ToolEnvelope>& pending,
                            const std::string& tool_name,
                            long long timeout_ms,
                            const CancellationToken& run,
                            const CancellationToken& invocation);

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_TOOLS_REGISTRY_H
