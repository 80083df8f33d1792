#include "list_state.hpp"

#include <algorithm>
#include <cctype>

namespace DockWatch {

    namespace {

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            return s;
        }

    }

    bool ListState::handle_key(const Key& key) {
        if (key.is("/")) {
            start_filter();
            return true;
        }
        if (key.is("up") || key.is("k")) select(selected_ - 1);
        else if (key.is("down") || key.is("j")) select(selected_ + 1);
        else if (key.is("pgup")) select(selected_ - page_);
        else if (key.is("pgdn")) select(selected_ + page_);
        else if (key.is("home")) select(0);
        else if (key.is("end")) select(count_ - 1);
        else return false;
        return true;
    }

    void ListState::handle_filter_key(const Key& key) {
        if (key.is("esc")) {
            clear_filter();
        } else if (key.is("enter")) {
            filtering_ = false;
        } else if (key.is("backspace")) {
            if (!filter_.empty()) filter_.pop_back();
            select(0);
        } else if (key.printable) {
            filter_ += key.name;
            select(0);
        }
    }

    void ListState::set_count(int count) {
        count_ = count < 0 ? 0 : count;
        select(selected_);
    }

    bool ListState::matches(const std::string& text) const {
        if (filter_.empty()) return true;
        return lower(text).find(lower(filter_)) != std::string::npos;
    }

    void ListState::select(int index) {
        if (count_ == 0) {
            selected_ = 0;
            scroll_ = 0;
            return;
        }
        selected_ = std::max(0, std::min(index, count_ - 1));
        follow_selection();
    }

    void ListState::follow_selection() {
        if (selected_ < scroll_) scroll_ = selected_;
        if (selected_ >= scroll_ + page_) scroll_ = selected_ - page_ + 1;
        scroll_ = std::max(0, std::min(scroll_, std::max(0, count_ - page_)));
    }

    void ListState::reset() {
        selected_ = 0;
        scroll_ = 0;
    }

    void ListState::start_filter() {
        filtering_ = true;
    }

    void ListState::clear_filter() {
        filtering_ = false;
        filter_.clear();
        select(0);
    }

}
