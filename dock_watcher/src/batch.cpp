#include "batch.hpp"
#include "models.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <system_error>
#include <thread>

namespace DockWatch {

    std::vector<std::string> BatchOutcome::failed_ids() const {
        std::vector<std::string> ids;
        for (const auto& f : failures) ids.push_back(f.id);
        return ids;
    }

    std::string BatchOutcome::message() const {
        if (ok()) return fmt::format("{} of {} succeeded", total, total);
        std::string text = fmt::format("{} of {} failed:", failures.size(), total);
        for (size_t i = 0; i < failures.size(); ++i) {
            text += fmt::format("{} {}: {}", i == 0 ? "" : ";", short_id(failures[i].id), failures[i].cause);
        }
        return text;
    }

    BatchOutcome run_batch(const std::vector<std::string>& ids, const BatchOperation& op, const OpContext& ctx) {
        BatchOutcome outcome;
        outcome.total = ids.size();

        // One slot per task, each written by exactly one worker
        std::vector<std::optional<std::string>> errors(ids.size());
        std::vector<std::thread> workers;
        workers.reserve(ids.size());

        for (size_t i = 0; i < ids.size(); ++i) {
            try {
                workers.emplace_back([&, i] {
                    try {
                        op(ctx, ids[i]);
                    } catch (const std::exception& e) {
                        errors[i] = e.what();
                    } catch (...) {
                        errors[i] = "unknown error";
                    }
                });
            } catch (const std::system_error& e) {
                spdlog::error("cannot start batch worker: {}", e.what());
                for (size_t j = i; j < ids.size(); ++j) errors[j] = std::string("not started: ") + e.what();
                break;
            }
        }
        for (auto& w : workers) w.join();

        for (size_t i = 0; i < ids.size(); ++i) {
            if (!errors[i]) continue;
            spdlog::warn("batch task {} failed: {}", short_id(ids[i]), *errors[i]);
            outcome.failures.push_back({ids[i], *errors[i]});
        }
        return outcome;
    }

}
