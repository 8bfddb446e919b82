// modules/parser/graph_parser.h
#ifndef BLOCKFLOW_MODULES_PARSER_GRAPH_PARSER_H
#define BLOCKFLOW_MODULES_PARSER_GRAPH_PARSER_H

#include "core/types/block.h"
#include "core/types/context.h"
#include <string>

namespace blockflow {

// Reads a serialized workflow graph (YAML, or JSON as a YAML subset).
//
//   workflow_id: wf-1
//   start: [start]            # optional
//   blocks:
//     - id: start
//       kind: starter
//     - id: f1
//       kind: function
//       inputs: { code: "return 1" }
//   edges:
//     - { source: start, target: f1 }
//
// Throws GraphValidationError for malformed documents.
class GraphParser {
public:
    WorkflowGraph parse_from_string(const std::string& content);
    WorkflowGraph parse_from_file(const std::string& file_path);
    WorkflowGraph parse_from_json(const Value& doc);

    Block create_block_from_json(const Value& block_json);
    Edge create_edge_from_json(const Value& edge_json);

private:
    void validate_blocks(const WorkflowGraph& graph);
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_PARSER_GRAPH_PARSER_H
