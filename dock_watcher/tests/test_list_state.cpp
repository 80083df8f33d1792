#include "list_state.hpp"

#include <gtest/gtest.h>

using namespace DockWatch;

TEST(ListState, SelectionIsClampedToCount) {
    ListState list;
    list.set_count(3);
    list.handle_key(Key::named("up"));
    EXPECT_EQ(list.selected(), 0);

    list.handle_key(Key::named("end"));
    EXPECT_EQ(list.selected(), 2);
    list.handle_key(Key::rune("j"));
    EXPECT_EQ(list.selected(), 2);

    list.set_count(1);
    EXPECT_EQ(list.selected(), 0);
    list.set_count(0);
    EXPECT_FALSE(list.has_selection());
}

TEST(ListState, ScrollFollowsSelection) {
    ListState list;
    list.set_page(5);
    list.set_count(20);

    list.select(7);
    EXPECT_EQ(list.scroll(), 3);
    list.handle_key(Key::named("pgdn"));
    EXPECT_EQ(list.selected(), 12);
    EXPECT_EQ(list.scroll(), 8);
    list.handle_key(Key::named("home"));
    EXPECT_EQ(list.scroll(), 0);
}

TEST(ListState, FilterMatchesCaseInsensitively) {
    ListState list;
    EXPECT_TRUE(list.handle_key(Key::rune("/")));
    EXPECT_TRUE(list.filtering());

    list.handle_filter_key(Key::rune("N"));
    list.handle_filter_key(Key::rune("g"));
    EXPECT_EQ(list.filter(), "Ng");
    EXPECT_TRUE(list.matches("nginx-proxy"));
    EXPECT_FALSE(list.matches("redis"));

    list.handle_filter_key(Key::named("enter"));
    EXPECT_FALSE(list.filtering());
    EXPECT_EQ(list.filter(), "Ng");
}

TEST(ListState, EscClearsFilter) {
    ListState list;
    list.start_filter();
    list.handle_filter_key(Key::rune("x"));
    list.handle_filter_key(Key::named("backspace"));
    list.handle_filter_key(Key::rune("y"));
    EXPECT_EQ(list.filter(), "y");

    list.handle_filter_key(Key::named("esc"));
    EXPECT_FALSE(list.filtering());
    EXPECT_TRUE(list.filter().empty());
    EXPECT_TRUE(list.matches("anything"));
}

TEST(ListState, UnknownKeyIsNotConsumed) {
    ListState list;
    list.set_count(2);
    EXPECT_FALSE(list.handle_key(Key::rune("s")));
}
