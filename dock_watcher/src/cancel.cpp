#include "cancel.hpp"

namespace DockWatch {

    CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

    CancelToken::CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void CancelToken::cancel() const {
        state_->flag.store(true);
    }

    bool CancelToken::cancelled() const {
        for (auto s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->flag.load()) return true;
        }
        return false;
    }

    CancelToken CancelToken::child() const {
        auto state = std::make_shared<State>();
        state->parent = state_;
        return CancelToken(state);
    }

    OpContext OpContext::with_timeout(const CancelToken& parent, int seconds) {
        OpContext ctx;
        ctx.token = parent.child();
        ctx.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        return ctx;
    }

    bool OpContext::expired() const {
        return std::chrono::steady_clock::now() >= deadline;
    }

    int OpContext::remaining_seconds() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - std::chrono::steady_clock::now()).count();
        // `timeout 0` would disable the limit entirely
        return left < 1 ? 1 : (int)left;
    }

}
