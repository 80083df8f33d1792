#ifndef DOCKWATCH_SCHEDULER_HPP
#define DOCKWATCH_SCHEDULER_HPP

#include "cancel.hpp"
#include "events.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace DockWatch {

    // Events produced off the UI thread, drained by the UI thread.
    class EventQueue {
    public:
        void push(Event event);
        std::vector<Event> drain();
        std::optional<Event> wait_pop(std::chrono::milliseconds timeout);
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Event> events_;
    };

    // Runs every Command on its own worker thread and posts the resulting
    // Event to the queue, then calls `wake` so the UI loop picks it up.
    class CommandScheduler {
    public:
        using Wake = std::function<void()>;

        CommandScheduler(EventQueue& queue, CancelToken root, Wake wake = nullptr);
        ~CommandScheduler();

        CommandScheduler(const CommandScheduler&) = delete;
        CommandScheduler& operator=(const CommandScheduler&) = delete;

        void schedule(Command command);
        void schedule_all(std::vector<Command> commands);

        // Cancels the root token and joins every worker. Later schedules are ignored.
        void shutdown();

        size_t active() const;
        const CancelToken& root() const { return root_; }

    private:
        struct Worker {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void reap(); // caller holds mutex_

        EventQueue& queue_;
        CancelToken root_;
        Wake wake_;
        mutable std::mutex mutex_;
        std::list<Worker> workers_;
        bool stopped_ = false;
    };

}

#endif
