#ifndef BLOCKFLOW_CORE_TYPES_BLOCK_H
#define BLOCKFLOW_CORE_TYPES_BLOCK_H

#include "context.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockflow {

enum class BlockKind : uint8_t {
    STARTER,
    FUNCTION,
    ROUTER,
    CONDITION,
    LOOP,
    TOOL // any other kind string: names an external tool
};

BlockKind block_kind_from_string(const std::string& kind);

// A node of the workflow graph. Immutable once a run starts.
struct Block {
    BlockId id;
    BlockKind kind = BlockKind::TOOL;
    std::string kind_name;          // raw discriminator as authored, e.g. "http_request"
    Value config = Value::object(); // tool id, static params, per-kind settings
    Value inputs = Value::object(); // input name -> unresolved expression
    bool enabled = true;
    bool best_effort = false;

    // Tool invoked by a generic tool block: config.tool, else the kind name.
    std::string tool_name() const;

    bool is_decision() const {
        return kind == BlockKind::ROUTER || kind == BlockKind::CONDITION;
    }
};

struct Edge {
    BlockId source;
    BlockId target;
    std::optional<std::string> label;

    // Decision outcome this edge stands for; unlabeled edges are named by their target.
    const std::string& branch_label() const { return label ? *label : target; }
};

struct WorkflowGraph {
    std::string workflow_id;
    std::vector<Block> blocks;         // declaration order
    std::vector<Edge> edges;
    std::vector<BlockId> start_blocks; // optional explicit roots

    const Block* find_block(const BlockId& id) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_CORE_TYPES_BLOCK_H
