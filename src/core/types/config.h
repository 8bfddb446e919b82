#ifndef BLOCKFLOW_CORE_TYPES_CONFIG_H
#define BLOCKFLOW_CORE_TYPES_CONFIG_H

#include <cstddef>

namespace blockflow {

struct ExecutorConfig {
    long long default_function_timeout_ms = 5000;
    long long default_tool_timeout_ms = 30000;
    std::size_t max_parallel_blocks = 8;
    int max_loop_iterations = 1000;
    int default_loop_iterations = 5;
    bool verbose = false; // [DEBUG] lines on stderr

    // budget; -1 means unlimited
    int max_block_executions = -1;
    long long max_duration_ms = -1;
};

} // namespace blockflow

#endif // BLOCKFLOW_CORE_TYPES_CONFIG_H
