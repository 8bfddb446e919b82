// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

namespace blockflow {

namespace {
constexpr auto kAwaitSlice = std::chrono::milliseconds(5);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::future<ToolEnvelope> ToolRegistry::invoke(const std::string& name, const Value& params, CancellationToken cancel) {
    ToolFunction fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it != tools_.end()) {
            fn = it->second;
        }
    }

    auto promise = std::make_shared<std::promise<ToolEnvelope>>();
    auto future = promise->get_future();

    if (!fn) {
        promise->set_value(ToolEnvelope::failure("Tool not found: " + name));
        return future;
    }

    // Detached: a timed-out tool may keep running until it observes `cancel`.
    std::thread([fn = std::move(fn), params, cancel = std::move(cancel), promise]() {
        try {
            promise->set_value(fn(params, cancel));
        } catch (const std::exception& e) {
            promise->set_value(ToolEnvelope::failure(std::string(e.what())));
        }
    }).detach();

    return future;
}

ToolEnvelope await_envelope(std::future<ToolEnvelope>& pending,
                            const std::string& tool_name,
                            long long timeout_ms,
                            const CancellationToken& run,
                            const CancellationToken& invocation) {
    const auto limit = std::chrono::milliseconds(std::clamp(timeout_ms, 0LL, kMaxToolTimeoutMs));
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        if (run.is_cancelled()) {
            invocation.cancel();
            throw CancelledError();
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            invocation.cancel();
            throw TimeoutError(tool_name, timeout_ms);
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(kAwaitSlice, deadline - now);
        if (pending.wait_for(slice) == std::future_status::ready) {
            return pending.get();
        }
    }
}

} // namespace blockflow
