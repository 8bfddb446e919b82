// modules/loop/loop_controller.cpp
#include "modules/loop/loop_controller.h"
#include "core/types/errors.h"
#include <algorithm>
#include <iostream>

namespace blockflow {

LoopPlans LoopController::plan(const GraphIndex& graph, const ExecutorConfig& config) {
    LoopPlans plans;
    std::unordered_map<BlockId, BlockId> owner;

    for (const auto& id : graph.topological_order()) {
        const Block& block = graph.block(id);
        if (block.kind != BlockKind::LOOP) continue;

        LoopPlan p;
        p.id = id;
        const Value& cfg = block.config;

        if (cfg.contains("collection")) {
            p.static_collection = cfg["collection"];
        }
        std::string mode = cfg.value("mode", std::string{});
        if (mode.empty()) {
            bool has_collection = p.static_collection.has_value() ||
                                  (block.inputs.is_object() && block.inputs.contains("collection"));
            p.mode = has_collection ? LoopMode::FOR_EACH : LoopMode::FOR;
        } else if (mode == "forEach" || mode == "for_each") {
            p.mode = LoopMode::FOR_EACH;
        } else if (mode == "for" || mode == "count") {
            p.mode = LoopMode::FOR;
        } else {
            throw GraphValidationError("Loop '" + id + "' has unknown mode: " + mode);
        }

        int iterations = config.default_loop_iterations;
        if (cfg.contains("iterations")) {
            if (!cfg["iterations"].is_number_integer()) {
                throw GraphValidationError("Loop '" + id + "': iterations must be an integer");
            }
            iterations = cfg["iterations"].get<int>();
        }
        if (iterations > config.max_loop_iterations) {
            std::cerr << "[WARNING] Loop '" << id << "' iterations " << iterations
                      << " clamped to " << config.max_loop_iterations << std::endl;
        }
        p.iterations = std::clamp(iterations, 0, std::max(config.max_loop_iterations, 0));

        auto downstream = graph.descendants(id);
        if (cfg.contains("body")) {
            if (!cfg["body"].is_array()) {
                throw GraphValidationError("Loop '" + id + "': body must be a list of block ids");
            }
            for (const auto& entry : cfg["body"]) {
                if (!entry.is_string()) {
                    throw GraphValidationError("Loop '" + id + "': body entries must be block ids");
                }
                BlockId member = entry.get<std::string>();
                if (!graph.contains(member)) {
                    throw GraphValidationError("Loop '" + id + "' body block not found: " + member);
                }
                if (downstream.count(member) == 0) {
                    throw GraphValidationError("Loop '" + id + "' body block '" + member + "' is not downstream of the loop");
                }
                p.body.insert(member);
            }
        } else {
            p.body = downstream;
        }

        for (const auto& member : graph.topological_order()) {
            if (p.body.count(member) == 0) continue;
            if (graph.block(member).kind == BlockKind::LOOP) {
                throw GraphValidationError("Nested loop '" + member + "' inside loop '" + id + "' is not supported");
            }
            auto [it, inserted] = owner.emplace(member, id);
            if (!inserted) {
                throw GraphValidationError("Block '" + member + "' belongs to loops '" + it->second + "' and '" + id + "'");
            }
            p.body_order.push_back(member);
        }

        // A body block may not wait on something that itself waits for the loop
        for (const auto& member : p.body_order) {
            for (std::size_t ei : graph.incoming(member)) {
                const BlockId& src = graph.edge(ei).source;
                if (src == id || p.body.count(src) > 0) continue;
                if (downstream.count(src) > 0) {
                    throw GraphValidationError("Loop '" + id + "' body block '" + member +
                                               "' depends on '" + src + "', which runs after the loop");
                }
            }
        }

        plans.emplace(id, std::move(p));
    }

    for (const auto& [member, loop_id] : owner) {
        if (plans.count(member) > 0) {
            throw GraphValidationError("Nested loop '" + member + "' inside loop '" + loop_id + "' is not supported");
        }
    }
    return plans;
}

LoopController::LoopController(const GraphIndex& graph, const LoopPlans& plans, const ExecutorConfig& config)
    : graph_(graph), plans_(plans), config_(config) {
    for (const auto& [loop_id, p] : plans_) {
        runtime_[loop_id];
        for (const auto& member : p.body) owner_[member] = loop_id;
    }
}

std::optional<BlockId> LoopController::owning_loop(const BlockId& id) const {
    auto it = owner_.find(id);
    if (it == owner_.end()) return std::nullopt;
    return it->second;
}

LoopState LoopController::state(const BlockId& loop_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_.at(loop_id).state;
}

int LoopController::current_iteration(const BlockId& loop_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_.at(loop_id).iteration;
}

bool LoopController::body_completed(const BlockId& block_id, int iteration) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.count({block_id, iteration}) > 0;
}

Value LoopController::parse_collection(const Value& raw) {
    if (raw.is_null()) {
        return Value::array();
    }
    if (raw.is_array()) {
        return raw;
    }
    if (raw.is_object()) {
        Value pairs = Value::array();
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            pairs.push_back(Value::array({it.key(), it.value()}));
        }
        return pairs;
    }
    if (raw.is_string()) {
        Value parsed = Value::parse(raw.get<std::string>(), nullptr, false);
        if (parsed.is_array() || parsed.is_object()) {
            return parse_collection(parsed);
        }
    }
    throw ExecutionError("Loop collection must be an array or an object, got: " + raw.dump());
}

void LoopController::begin(const BlockId& loop_id, const Value& inputs, ExecutionContext& ctx, const PathResolver& path) {
    const LoopPlan& p = plans_.at(loop_id);

    std::vector<Value> items;
    if (p.mode == LoopMode::FOR_EACH) {
        Value raw;
        if (inputs.is_object() && inputs.contains("collection")) {
            raw = inputs["collection"];
        } else if (p.static_collection) {
            raw = *p.static_collection;
        }
        Value collection = parse_collection(raw);
        for (const auto& item : collection) {
            if (static_cast<int>(items.size()) >= config_.max_loop_iterations) {
                std::cerr << "[WARNING] Loop '" << loop_id << "' collection truncated to "
                          << config_.max_loop_iterations << " items" << std::endl;
                break;
            }
            items.push_back(item);
        }
    } else {
        for (int i = 0; i < p.iterations; ++i) items.emplace_back(i);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Runtime& rt = runtime_.at(loop_id);
    if (rt.state != LoopState::PENDING) {
        throw ExecutionError("Loop '" + loop_id + "' already started");
    }
    rt.items = std::move(items);
    if (rt.items.empty()) {
        rt.state = LoopState::COMPLETED;
        ctx.transact([&](ExecutionContext::State& s) {
            s.loop_iterations[loop_id] = 0;
            s.loop_results[loop_id] = Value::array();
        });
        return;
    }
    ctx.transact([&](ExecutionContext::State& s) {
        s.loop_results[loop_id] = Value::array();
    });
    start_iteration(p, rt, 0, ctx, path);
}

void LoopController::start_iteration(const LoopPlan& p, Runtime& rt, int index, ExecutionContext& ctx, const PathResolver& path) {
    rt.state = LoopState::ITERATING;
    rt.iteration = index;
    const Value& item = rt.items[static_cast<std::size_t>(index)];
    ctx.transact([&](ExecutionContext::State& s) {
        s.loop_items[p.id] = item;
        s.loop_iterations[p.id] = index + 1;
        s.loop_results[p.id].push_back(Value::object());
        for (const auto& member : p.body) {
            s.decisions.router.erase(member);
            s.decisions.condition.erase(member);
        }
        path.reactivate_body(p.id, s);
    });
    if (config_.verbose) {
        std::cerr << "[DEBUG] Loop '" << p.id << "' iteration " << index + 1 << "/" << rt.items.size() << std::endl;
    }
}

void LoopController::record_body_output(const BlockId& block_id, int iteration, const Value& output, ExecutionContext& ctx) {
    BlockId loop_id = owner_.at(block_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_.insert({block_id, iteration});
    }
    ctx.transact([&](ExecutionContext::State& s) {
        Value& results = s.loop_results[loop_id];
        if (results.is_array() && iteration < static_cast<int>(results.size())) {
            results[static_cast<std::size_t>(iteration)][block_id] = output;
        }
    });
}

bool LoopController::advance(ExecutionContext& ctx, const PathResolver& path) {
    auto active = ctx.active_execution_path();
    bool changed = false;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : graph_.topological_order()) {
        auto pit = plans_.find(id);
        if (pit == plans_.end()) continue;
        const LoopPlan& p = pit->second;
        Runtime& rt = runtime_.at(id);
        if (rt.state != LoopState::ITERATING) continue;

        bool pass_done = std::all_of(p.body_order.begin(), p.body_order.end(), [&](const BlockId& member) {
            return active.count(member) == 0 || completed_.count({member, rt.iteration}) > 0;
        });
        if (!pass_done) continue;

        changed = true;
        if (rt.iteration + 1 < static_cast<int>(rt.items.size())) {
            start_iteration(p, rt, rt.iteration + 1, ctx, path);
            active = ctx.active_execution_path();
        } else {
            rt.state = LoopState::COMPLETED;
            if (config_.verbose) {
                std::cerr << "[DEBUG] Loop '" << id << "' completed after " << rt.items.size() << " iterations" << std::endl;
            }
        }
    }
    return changed;
}

Value LoopController::aggregate(const BlockId& loop_id, const ExecutionContext& ctx) {
    return Value{
        {"results", ctx.loop_results(loop_id)},
        {"iterations", ctx.loop_iteration(loop_id)}
    };
}

} // namespace blockflow
