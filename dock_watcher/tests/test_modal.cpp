#include "modal.hpp"

#include <gtest/gtest.h>

using namespace DockWatch;

TEST(Modal, ConfirmAcceptsYesAndEnter) {
    auto m = Modal::confirm("Delete", "Delete web?");
    EXPECT_EQ(m.handle_key(Key::rune("x")), Modal::Result::Pending);
    EXPECT_EQ(m.handle_key(Key::rune("y")), Modal::Result::Confirmed);

    auto e = Modal::confirm("Delete", "Delete web?");
    EXPECT_EQ(e.handle_key(Key::named("enter")), Modal::Result::Confirmed);
}

TEST(Modal, ConfirmCancelsOnNoAndEsc) {
    auto m = Modal::confirm("Delete", "Delete web?");
    EXPECT_EQ(m.handle_key(Key::rune("N")), Modal::Result::Cancelled);

    auto e = Modal::confirm("Delete", "Delete web?");
    EXPECT_EQ(e.handle_key(Key::named("esc")), Modal::Result::Cancelled);
    // Result is sticky
    EXPECT_EQ(e.handle_key(Key::rune("y")), Modal::Result::Cancelled);
}

TEST(Modal, FormRequiresRequiredFields) {
    auto m = Modal::form("New group", {{"Name", "", true}, {"Description", "", false}});
    EXPECT_EQ(m.handle_key(Key::named("enter")), Modal::Result::Pending);
    EXPECT_EQ(m.error(), "Name is required");

    m.handle_key(Key::rune("w"));
    m.handle_key(Key::rune("e"));
    m.handle_key(Key::rune("b"));
    EXPECT_TRUE(m.error().empty());
    EXPECT_EQ(m.handle_key(Key::named("enter")), Modal::Result::Confirmed);
    EXPECT_EQ(m.value("Name"), "web");
    EXPECT_EQ(m.value("Description"), "");
}

TEST(Modal, FormFocusWraps) {
    auto m = Modal::form("New network", {{"Name", "", true}, {"Driver", "bridge", false}});
    EXPECT_EQ(m.focus(), 0);
    m.handle_key(Key::named("tab"));
    EXPECT_EQ(m.focus(), 1);
    m.handle_key(Key::named("backspace"));
    EXPECT_EQ(m.value("Driver"), "bridg");
    m.handle_key(Key::named("tab"));
    EXPECT_EQ(m.focus(), 0);
    m.handle_key(Key::named("shift+tab"));
    EXPECT_EQ(m.focus(), 1);
}

TEST(Modal, FormEscCancels) {
    auto m = Modal::form("Pull image", {{"Image", "", true}});
    m.handle_key(Key::rune("a"));
    EXPECT_EQ(m.handle_key(Key::named("esc")), Modal::Result::Cancelled);
}
