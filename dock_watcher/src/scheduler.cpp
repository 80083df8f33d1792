#include "scheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace DockWatch {

    // --- EventQueue ---

    void EventQueue::push(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::vector<Event> EventQueue::drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
        events_.clear();
        return out;
    }

    std::optional<Event> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) return std::nullopt;
        Event e = std::move(events_.front());
        events_.pop_front();
        return e;
    }

    size_t EventQueue::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    // --- CommandScheduler ---

    CommandScheduler::CommandScheduler(EventQueue& queue, CancelToken root, Wake wake)
        : queue_(queue), root_(std::move(root)), wake_(std::move(wake)) {}

    CommandScheduler::~CommandScheduler() {
        shutdown();
    }

    void CommandScheduler::reap() {
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void CommandScheduler::schedule(Command command) {
        if (!command) return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        reap();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, command = std::move(command), done] {
            std::optional<Event> event;
            try {
                event = command();
            } catch (const std::exception& e) {
                spdlog::error("command failed: {}", e.what());
                event = Notice{e.what(), true};
            } catch (...) {
                spdlog::error("command failed with an unknown exception");
                event = Notice{"unexpected failure in background task", true};
            }

            if (event && !root_.cancelled()) {
                queue_.push(std::move(*event));
                if (wake_) wake_();
            }
            done->store(true);
        });
        workers_.push_back(Worker{std::move(t), done});
    }

    void CommandScheduler::schedule_all(std::vector<Command> commands) {
        for (auto& c : commands) schedule(std::move(c));
    }

    void CommandScheduler::shutdown() {
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) return;
            stopped_ = true;
            root_.cancel();
            workers.swap(workers_);
        }
        spdlog::info("scheduler shutting down, joining {} workers", workers.size());
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    size_t CommandScheduler::active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& w : workers_) {
            if (!w.done->load()) n++;
        }
        return n;
    }

}
