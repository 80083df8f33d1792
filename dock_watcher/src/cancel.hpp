#ifndef DOCKWATCH_CANCEL_HPP
#define DOCKWATCH_CANCEL_HPP

#include <atomic>
#include <chrono>
#include <memory>

namespace DockWatch {

    // Shared cancellation flag. A child token reports cancelled when any
    // ancestor has been cancelled.
    class CancelToken {
    public:
        CancelToken();

        void cancel() const;
        bool cancelled() const;
        CancelToken child() const;

    private:
        struct State {
            std::atomic<bool> flag{false};
            std::shared_ptr<State> parent;
        };
        explicit CancelToken(std::shared_ptr<State> state);

        std::shared_ptr<State> state_;
    };

    // Token plus deadline handed to every blocking Resource Client call.
    struct OpContext {
        CancelToken token;
        std::chrono::steady_clock::time_point deadline;

        static OpContext with_timeout(const CancelToken& parent, int seconds);

        bool expired() const;
        bool done() const { return expired() || token.cancelled(); }
        int remaining_seconds() const;
    };

}

#endif
