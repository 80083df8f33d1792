#ifndef DOCKWATCH_RENDER_HPP
#define DOCKWATCH_RENDER_HPP

#include "app_state.hpp"
#include "keys.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

#include <optional>

namespace DockWatch {

    // Whole screen: sidebar, header, active view, footer and modal overlay.
    ftxui::Element render(const AppState& state);

    // Terminal event to Key; nullopt for mouse, cursor reports and the like.
    std::optional<Key> to_key(const ftxui::Event& event);

}

#endif
