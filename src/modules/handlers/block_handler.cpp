// modules/handlers/block_handler.cpp
#include "modules/handlers/block_handler.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace blockflow {

Value ToolBackedHandler::call_tool(const std::string& tool_name,
                                   const Value& params,
                                   long long timeout_ms,
                                   const CancellationToken& cancel,
                                   const std::string& fallback_message) {
    if (cancel.is_cancelled()) {
        throw CancelledError();
    }
    CancellationToken invocation = cancel.child();
    auto pending = tools_.invoke(tool_name, params, invocation);
    ToolEnvelope envelope = await_envelope(pending, tool_name, timeout_ms, cancel, invocation);

    if (!envelope.success) {
        throw ToolInvocationError(tool_name, envelope.error.value_or(fallback_message));
    }
    return envelope.output.value_or(Value());
}

long long ToolBackedHandler::timeout_ms_from(const Value& timeout, long long fallback) {
    if (timeout.is_number_unsigned()) {
        return static_cast<long long>(std::min<std::uint64_t>(timeout.get<std::uint64_t>(), kMaxToolTimeoutMs));
    }
    if (timeout.is_number_integer()) {
        return std::clamp(timeout.get<long long>(), 0LL, kMaxToolTimeoutMs);
    }
    if (timeout.is_number_float()) {
        double ms = timeout.get<double>();
        if (std::isnan(ms)) return fallback;
        return static_cast<long long>(std::clamp(ms, 0.0, static_cast<double>(kMaxToolTimeoutMs)));
    }
    return fallback;
}

} // namespace blockflow
