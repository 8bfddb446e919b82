// core/types/block.cpp
#include "block.h"

namespace blockflow {

BlockKind block_kind_from_string(const std::string& kind) {
    if (kind == "starter") return BlockKind::STARTER;
    if (kind == "function") return BlockKind::FUNCTION;
    if (kind == "router") return BlockKind::ROUTER;
    if (kind == "condition") return BlockKind::CONDITION;
    if (kind == "loop") return BlockKind::LOOP;
    return BlockKind::TOOL;
}

std::string Block::tool_name() const {
    if (config.is_object() && config.contains("tool") && config["tool"].is_string()) {
        return config["tool"].get<std::string>();
    }
    return kind_name;
}

const Block* WorkflowGraph::find_block(const BlockId& id) const {
    for (const auto& block : blocks) {
        if (block.id == id) {
            return &block;
        }
    }
    return nullptr;
}

} // namespace blockflow
