#include "fake_client.hpp"
#include "reducer.hpp"

#include <gtest/gtest.h>

using namespace DockWatch;

namespace {

    Group make_group(const std::string& id, const std::string& name) {
        Group g;
        g.id = id;
        g.name = name;
        return g;
    }

}

TEST(InputRouter, ModalTakesEverything) {
    AppState s;
    s.modal = Modal::confirm("Delete", "Delete web?");
    EXPECT_EQ(route_key(s, Key::rune("q")), KeyConsumer::Modal);
    EXPECT_EQ(route_key(s, Key::named("ctrl+c")), KeyConsumer::Modal);
    EXPECT_EQ(route_key(s, Key::rune("1")), KeyConsumer::Modal);
}

TEST(InputRouter, FilterBeatsGlobalKeys) {
    AppState s;
    s.containers.set_items({make_container("a", "web")});
    s.containers.handle_key(Key::rune("/"));
    ASSERT_TRUE(s.containers.is_filtering());

    EXPECT_EQ(route_key(s, Key::rune("q")), KeyConsumer::Filter);
    EXPECT_EQ(route_key(s, Key::rune("2")), KeyConsumer::Filter);
    EXPECT_EQ(route_key(s, Key::named("esc")), KeyConsumer::Filter);
}

TEST(InputRouter, GlobalThenView) {
    AppState s;
    EXPECT_EQ(route_key(s, Key::rune("q")), KeyConsumer::Global);
    EXPECT_EQ(route_key(s, Key::named("tab")), KeyConsumer::Global);
    EXPECT_EQ(route_key(s, Key::rune("?")), KeyConsumer::Global);
    EXPECT_EQ(route_key(s, Key::rune("s")), KeyConsumer::View);
    EXPECT_EQ(route_key(s, Key::named("down")), KeyConsumer::View);
}

TEST(InputRouter, OnlyMainViewDigitsAreGlobal) {
    AppState s;
    for (char d = '1'; d <= '7'; ++d) EXPECT_TRUE(is_global_key(s, Key::rune(std::string(1, d)))) << d;
    EXPECT_FALSE(is_global_key(s, Key::rune("8")));
    EXPECT_FALSE(is_global_key(s, Key::rune("9")));
    EXPECT_FALSE(is_global_key(s, Key::rune("0")));
}

TEST(InputRouter, EscStaysInsideDrilledViews) {
    AppState s;
    s.current_view = ViewKind::Groups;
    EXPECT_TRUE(is_global_key(s, Key::named("esc")));

    s.groups.set_groups({make_group("g1", "stack")});
    s.groups.handle_key(Key::named("enter"));
    ASSERT_EQ(s.groups.tab, GroupsView::Members);
    EXPECT_FALSE(is_global_key(s, Key::named("esc")));
    EXPECT_EQ(route_key(s, Key::named("esc")), KeyConsumer::View);

    s.current_view = ViewKind::Compose;
    EXPECT_TRUE(is_global_key(s, Key::named("esc")));
    s.compose.level = ComposeView::Services;
    EXPECT_FALSE(is_global_key(s, Key::named("esc")));
}

TEST(InputRouter, DetailViews) {
    EXPECT_TRUE(is_detail_view(ViewKind::Logs));
    EXPECT_TRUE(is_detail_view(ViewKind::Stats));
    EXPECT_TRUE(is_detail_view(ViewKind::EnvVars));
    EXPECT_TRUE(is_detail_view(ViewKind::About));
    EXPECT_FALSE(is_detail_view(ViewKind::Containers));
    EXPECT_FALSE(is_detail_view(ViewKind::Compose));
}
