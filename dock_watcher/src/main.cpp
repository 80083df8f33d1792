#include "config.hpp"
#include "docker_cli.hpp"
#include "group_store.hpp"
#include "logging.hpp"
#include "reducer.hpp"
#include "render.hpp"
#include "scheduler.hpp"
#include "shell.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/screen/terminal.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

#ifndef DOCKWATCH_VERSION
#define DOCKWATCH_VERSION "0.0.0"
#endif

using namespace ftxui;
using namespace DockWatch;

namespace {

    void print_help() {
        std::cout << "Usage: dock-watcher [--version] [--help]\n\n"
                  << "Terminal dashboard for Docker containers, images, volumes, networks,\n"
                  << "compose projects and user-defined container groups.\n\n"
                  << "Environment:\n"
                  << "  DOCKWATCH_CONFIG_PATH  config directory (default ~/.config/dock-watcher)\n"
                  << "  DOCKWATCH_LOG_LEVEL    trace, debug, info, warn, error\n"
                  << "  DOCKWATCH_DOCKER       docker binary to run\n";
    }

}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "dock-watcher " << DOCKWATCH_VERSION << "\n";
            return 0;
        }
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_help();
            return 0;
        }
        std::cerr << "dock-watcher: unknown argument '" << argv[i] << "'\n";
        print_help();
        return 2;
    }

    // --- Startup ---
    AppConfig config;
    try {
        config = load_config(default_config_dir());
    } catch (const std::exception& e) {
        std::cerr << "dock-watcher: " << e.what() << "\n";
        return 1;
    }
    setup_logging(config);
    spdlog::info("dock-watcher {} starting, config dir {}", DOCKWATCH_VERSION, config.config_dir);

    CancelToken root;
    auto client = std::make_shared<DockerCliClient>(config.docker_binary);

    std::string version;
    try {
        version = client->ping(OpContext::with_timeout(root, config.list_timeout));
    } catch (const std::exception& e) {
        spdlog::error("docker daemon unreachable: {}", e.what());
        std::cerr << "dock-watcher: cannot reach the Docker daemon: " << e.what() << "\n";
        return 1;
    }
    spdlog::info("connected to docker engine {}", version);

    EventQueue queue;
    std::shared_ptr<GroupStore> groups;
    try {
        groups = GroupStore::open(config.groups_path());
    } catch (const std::exception& e) {
        spdlog::error("group store unavailable: {}", e.what());
        groups = GroupStore::in_memory();
        queue.push(Notice{std::string("groups not saved this session: ") + e.what(), true});
    }

    auto screen = ScreenInteractive::Fullscreen();
    screen.ForceHandleCtrlC(false);

    CommandScheduler scheduler(queue, root, [&screen] { screen.Post(ftxui::Event::Custom); });
    Reducer reducer(Services{client, groups, config, root});

    AppState state;
    state.docker_version = version;
    auto size = Terminal::Size();
    reducer.reduce(state, Resized{size.dimx, size.dimy});
    scheduler.schedule_all(reducer.start(state));

    // --- Event plumbing ---
    auto dispatch = [&](const DockWatch::Event& event) {
        scheduler.schedule_all(reducer.reduce(state, event));

        if (state.shell_request) {
            ShellRequest req = *state.shell_request;
            state.shell_request.reset();
            spdlog::info("opening shell in {}", req.container_name);
            int code = -1;
            screen.WithRestoredIO([&] {
                code = run_interactive({config.docker_binary, "exec", "-it", req.container_id, "sh"});
            })();
            queue.push(ShellExited{req.container_id, code});
            screen.Post(ftxui::Event::Custom);
        }
        if (state.quit) screen.Exit();
    };

    auto check_size = [&] {
        auto dim = Terminal::Size();
        if (dim.dimx != state.width || dim.dimy != state.height) dispatch(Resized{dim.dimx, dim.dimy});
    };

    auto renderer = Renderer([&] { return render(state); });

    renderer = CatchEvent(renderer, [&](ftxui::Event event) {
        if (state.quit) return true;
        check_size();

        if (event == ftxui::Event::Custom) {
            for (auto& e : queue.drain()) {
                dispatch(e);
                if (state.quit) break;
            }
            return true;
        }

        auto key = to_key(event);
        if (!key) return false;
        dispatch(KeyPressed{*key});
        return true;
    });

    std::atomic<bool> running{true};
    std::thread tick_thread([&] {
        auto interval = std::chrono::milliseconds(config.tick_interval_ms);
        while (running) {
            std::this_thread::sleep_for(interval);
            if (!running) break;
            queue.push(Tick{Clock::now()});
            screen.Post(ftxui::Event::Custom);
        }
    });

    screen.Loop(renderer);

    // --- Shutdown ---
    running = false;
    if (tick_thread.joinable()) tick_thread.join();
    reducer.teardown(state);
    scheduler.shutdown();
    // Queued stream handles join their producers; that must happen before the logger goes away
    auto undelivered = queue.drain();
    spdlog::debug("dropping {} undelivered events", undelivered.size());
    undelivered.clear();
    spdlog::info("dock-watcher stopped");
    spdlog::shutdown();
    return 0;
}
