#ifndef DOCKWATCH_REDUCER_HPP
#define DOCKWATCH_REDUCER_HPP

#include "app_state.hpp"
#include "commands.hpp"
#include "events.hpp"

#include <string>
#include <vector>

namespace DockWatch {

    // Who handles a key, in priority order.
    enum class KeyConsumer { Modal, Filter, Global, View };

    KeyConsumer route_key(const AppState& state, const Key& key);
    bool is_global_key(const AppState& state, const Key& key);
    bool is_detail_view(ViewKind kind);

    // Sole mutator of AppState. Handles one event at a time and returns the
    // side effects as commands; nothing blocking happens in here.
    class Reducer {
    public:
        explicit Reducer(Services services);

        std::vector<Command> reduce(AppState& state, const Event& event);

        // Initial loads for every view.
        std::vector<Command> start(AppState& state);
        // Closes any live log/stats subscription.
        void teardown(AppState& state);

        const Services& services() const { return services_; }

        // --- Event handlers ---
        std::vector<Command> handle(AppState& s, const KeyPressed& e);
        std::vector<Command> handle(AppState& s, const Resized& e);
        std::vector<Command> handle(AppState& s, const Tick& e);
        std::vector<Command> handle(AppState& s, const ContainersLoaded& e);
        std::vector<Command> handle(AppState& s, const ImagesLoaded& e);
        std::vector<Command> handle(AppState& s, const VolumesLoaded& e);
        std::vector<Command> handle(AppState& s, const NetworksLoaded& e);
        std::vector<Command> handle(AppState& s, const ComposeLoaded& e);
        std::vector<Command> handle(AppState& s, const GroupsLoaded& e);
        std::vector<Command> handle(AppState& s, const OperationFinished& e);
        std::vector<Command> handle(AppState& s, const BatchFinished& e);
        std::vector<Command> handle(AppState& s, const ConfigLoaded& e);
        std::vector<Command> handle(AppState& s, const RecreateFinished& e);
        std::vector<Command> handle(AppState& s, const LogStreamOpened& e);
        std::vector<Command> handle(AppState& s, const StatsStreamOpened& e);
        std::vector<Command> handle(AppState& s, const LogReceived& e);
        std::vector<Command> handle(AppState& s, const StatsReceived& e);
        std::vector<Command> handle(AppState& s, const StreamFailed& e);
        std::vector<Command> handle(AppState& s, const ShellExited& e);
        std::vector<Command> handle(AppState& s, const Notice& e);

    private:
        // --- Input ---
        std::vector<Command> modal_key(AppState& s, const Key& key);
        void filter_key(AppState& s, const Key& key);
        std::vector<Command> global_key(AppState& s, const Key& key);
        Intent view_key(AppState& s, const Key& key);

        std::vector<Command> perform(AppState& s, const Intent& intent);
        std::vector<Command> confirm(AppState& s, const PendingAction& action, const Modal& modal);
        void ask(AppState& s, const Intent& intent, Modal modal);

        // --- Navigation ---
        std::vector<Command> switch_view(AppState& s, ViewKind target);
        std::vector<Command> refresh(const AppState& s, ViewKind view) const;
        void close_streams(AppState& s);

        void set_banner(AppState& s, const std::string& text, bool is_error) const;

        Services services_;
    };

}

#endif
