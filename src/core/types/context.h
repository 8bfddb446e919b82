#ifndef BLOCKFLOW_CORE_TYPES_CONTEXT_H
#define BLOCKFLOW_CORE_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <string>

namespace blockflow {

// nlohmann::json is the single value type for inputs, outputs and config
using Value = nlohmann::json;

using BlockId = std::string;

} // namespace blockflow

#endif // BLOCKFLOW_CORE_TYPES_CONTEXT_H
