// common/utils/yaml_json.h
#ifndef BLOCKFLOW_COMMON_UTILS_YAML_JSON_H
#define BLOCKFLOW_COMMON_UTILS_YAML_JSON_H

#include "core/types/context.h"
#include <yaml-cpp/yaml.h>

namespace blockflow {

// Converts a YAML::Node to a Value. Plain scalars become bool/null/number when
// they read as one; quoted scalars stay strings.
Value yaml_to_json(const YAML::Node& node);

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_YAML_JSON_H
