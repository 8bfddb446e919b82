// modules/parser/graph_parser.cpp
#include "modules/parser/graph_parser.h"
#include "common/utils/parser_utils.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace blockflow {

namespace {

std::string require_string(const Value& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw GraphValidationError(std::string("Missing '") + key + "' in " + where);
    }
    return j[key].get<std::string>();
}

} // namespace

WorkflowGraph GraphParser::parse_from_string(const std::string& content) {
    Value doc;
    try {
        YAML::Node root = YAML::Load(content);
        doc = yaml_to_json(root);
    } catch (const YAML::Exception& e) {
        throw GraphValidationError("YAML parse error in workflow graph: " + std::string(e.what()));
    }
    return parse_from_json(doc);
}

WorkflowGraph GraphParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw GraphValidationError("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

WorkflowGraph GraphParser::parse_from_json(const Value& doc) {
    if (!doc.is_object()) {
        throw GraphValidationError("Workflow graph must be a mapping");
    }

    WorkflowGraph graph;
    graph.workflow_id = doc.value("workflow_id", std::string("workflow"));

    if (!doc.contains("blocks") || !doc["blocks"].is_array()) {
        throw GraphValidationError("Workflow graph has no 'blocks' list");
    }
    for (const auto& block_json : doc["blocks"]) {
        graph.blocks.push_back(create_block_from_json(block_json));
    }

    if (doc.contains("edges")) {
        if (!doc["edges"].is_array()) {
            throw GraphValidationError("'edges' must be a list");
        }
        for (const auto& edge_json : doc["edges"]) {
            graph.edges.push_back(create_edge_from_json(edge_json));
        }
    }

    if (doc.contains("start")) {
        const auto& start = doc["start"];
        if (start.is_string()) {
            graph.start_blocks.push_back(start.get<std::string>());
        } else if (start.is_array()) {
            for (const auto& s : start) {
                graph.start_blocks.push_back(s.get<std::string>());
            }
        } else {
            throw GraphValidationError("'start' must be a block id or a list of block ids");
        }
    }

    validate_blocks(graph);
    return graph;
}

Block GraphParser::create_block_from_json(const Value& block_json) {
    if (!block_json.is_object()) {
        throw GraphValidationError("Block entry must be a mapping");
    }
    Block block;
    block.id = require_string(block_json, "id", "block");
    if (!is_valid_block_id(block.id)) {
        throw GraphValidationError("Invalid block id: '" + block.id + "'");
    }

    // "type" is accepted as an alias of "kind"
    const char* kind_key = block_json.contains("kind") ? "kind" : "type";
    block.kind_name = require_string(block_json, kind_key, "block '" + block.id + "'");
    block.kind = block_kind_from_string(block.kind_name);

    block.config = block_json.value("config", Value::object());
    if (!block.config.is_object()) {
        throw GraphValidationError("'config' of block '" + block.id + "' must be a mapping");
    }
    block.inputs = block_json.value("inputs", Value::object());
    if (!block.inputs.is_object()) {
        throw GraphValidationError("'inputs' of block '" + block.id + "' must be a mapping");
    }
    block.enabled = block_json.value("enabled", true);
    block.best_effort = block_json.value("best_effort", false);
    return block;
}

Edge GraphParser::create_edge_from_json(const Value& edge_json) {
    if (!edge_json.is_object()) {
        throw GraphValidationError("Edge entry must be a mapping");
    }
    Edge edge;
    edge.source = require_string(edge_json, "source", "edge");
    edge.target = require_string(edge_json, "target", "edge from '" + edge.source + "'");
    if (edge_json.contains("label") && !edge_json["label"].is_null()) {
        const auto& label = edge_json["label"];
        // `label: true` in YAML arrives as a bool
        edge.label = label.is_string() ? label.get<std::string>() : label.dump();
    }
    return edge;
}

void GraphParser::validate_blocks(const WorkflowGraph& graph) {
    std::unordered_set<BlockId> ids;
    for (const auto& block : graph.blocks) {
        if (!ids.insert(block.id).second) {
            throw GraphValidationError("Duplicate block id: " + block.id);
        }
    }
    for (const auto& edge : graph.edges) {
        if (!ids.count(edge.source)) {
            throw GraphValidationError("Edge source not found: " + edge.source);
        }
        if (!ids.count(edge.target)) {
            throw GraphValidationError("Edge target not found: " + edge.target);
        }
    }
    for (const auto& start : graph.start_blocks) {
        if (!ids.count(start)) {
            throw GraphValidationError("Start block not found: " + start);
        }
    }
}

} // namespace blockflow
