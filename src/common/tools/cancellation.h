#ifndef BLOCKFLOW_COMMON_TOOLS_CANCELLATION_H
#define BLOCKFLOW_COMMON_TOOLS_CANCELLATION_H

#include <atomic>
#include <memory>

namespace blockflow {

// Copyable handle to a shared cancellation flag. A child token reports
// cancellation when it or any of its ancestors is cancelled.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() const { state_->cancelled.store(true); }

    bool is_cancelled() const {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->cancelled.load()) return true;
        }
        return false;
    }

    CancellationToken child() const {
        CancellationToken token;
        token.state_->parent = state_;
        return token;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };
    std::shared_ptr<State> state_;
};

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_TOOLS_CANCELLATION_H
