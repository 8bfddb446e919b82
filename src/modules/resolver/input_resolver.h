// modules/resolver/input_resolver.h
#ifndef BLOCKFLOW_MODULES_RESOLVER_INPUT_RESOLVER_H
#define BLOCKFLOW_MODULES_RESOLVER_INPUT_RESOLVER_H

#include "core/types/block.h"
#include "core/types/context.h"
#include "modules/context/execution_context.h"
#include "modules/scheduler/graph_index.h"
#include "common/utils/parser_utils.h"
#include <optional>
#include <string>

namespace blockflow {

// Turns a block's declared inputs into concrete values.
//
//  - literals pass through; objects and arrays are resolved element-wise
//  - "<blockId.field>" reads blockStates[blockId][field]; a string holding only the
//    reference keeps the referenced JSON type, embedded references are interpolated
//  - a reference to a pruned or disabled block without output is null, or empty
//    text when embedded; an active block without output is UnresolvedReferenceError
//  - "{{NAME}}" / "{{NAME|fallback}}" read the run's environment variables
//  - "<loop.index>", "<loop.currentItem>", "<loop.iteration>" inside a loop body
//  - "<start.input>" is the workflow input when no block is called "start"
//  - a "code" input given as [{content: ...}, ...] is joined with "\n"
//
// Angle-bracket tokens naming no known block are left as text.
class InputResolver {
public:
    explicit InputResolver(const GraphIndex& graph);

    Value resolve(const Block& block,
                  const ExecutionContext& ctx,
                  const std::optional<BlockId>& loop_scope = std::nullopt) const;

    Value resolve_value(const Value& expr,
                        const ExecutionContext& ctx,
                        const std::optional<BlockId>& loop_scope = std::nullopt) const;

    // Fragments (objects with "content", or strings) joined by newline; nullopt if not a fragment list
    static std::optional<std::string> join_code_fragments(const Value& code);

private:
    const GraphIndex& graph_;

    Value resolve_string(const std::string& text, const ExecutionContext& ctx, const std::optional<BlockId>& loop_scope) const;
    std::optional<Value> resolve_reference(const InputToken& token, const ExecutionContext& ctx, const std::optional<BlockId>& loop_scope) const;
    // Source block has no output and is pruned or disabled, so it never will
    bool never_runs(const InputToken& token, const ExecutionContext& ctx, const std::optional<BlockId>& loop_scope) const;
    std::string resolve_environment(const InputToken& token, const ExecutionContext& ctx) const;
    Value loop_view(const BlockId& loop_id, const ExecutionContext& ctx) const;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_RESOLVER_INPUT_RESOLVER_H
