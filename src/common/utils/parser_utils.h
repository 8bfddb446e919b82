#ifndef BLOCKFLOW_COMMON_UTILS_PARSER_UTILS_H
#define BLOCKFLOW_COMMON_UTILS_PARSER_UTILS_H

#include "core/types/context.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

// One reference found inside an input string
struct InputToken {
    enum class Type {
        BLOCK_REFERENCE, // <blockId.field.sub>
        ENV_VARIABLE     // {{NAME}} or {{NAME|fallback}}
    };

    Type type;
    std::size_t offset = 0;
    std::size_t length = 0;
    std::string name;                   // block id or variable name
    std::vector<std::string> path;      // field path after the block id
    std::optional<std::string> fallback;
    std::string raw;                    // matched text
};

// Tokens in order of appearance
std::vector<InputToken> scan_input_tokens(const std::string& text);

// Looks up a dotted field path; numeric segments index arrays. Missing -> null.
Value lookup_path(const Value& root, const std::vector<std::string>& path);

bool is_valid_block_id(const std::string& id);

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_PARSER_UTILS_H
