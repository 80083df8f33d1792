#ifndef DOCKWATCH_LIST_STATE_HPP
#define DOCKWATCH_LIST_STATE_HPP

#include "keys.hpp"

#include <string>

namespace DockWatch {

    // Selection, scroll window and text filter of one list.
    class ListState {
    public:
        // Navigation and filter keys. Returns true when the key was used.
        bool handle_key(const Key& key);
        // Keys while the filter prompt is open; always consumes.
        void handle_filter_key(const Key& key);

        // Clamp selection and scroll after the visible item count changed.
        void set_count(int count);
        void set_page(int rows) { page_ = rows < 1 ? 1 : rows; }

        bool matches(const std::string& text) const;

        int selected() const { return selected_; }
        int scroll() const { return scroll_; }
        int count() const { return count_; }
        int page() const { return page_; }
        bool has_selection() const { return count_ > 0 && selected_ >= 0 && selected_ < count_; }
        void select(int index);
        void reset();

        bool filtering() const { return filtering_; }
        const std::string& filter() const { return filter_; }
        void start_filter();
        void clear_filter();

    private:
        void follow_selection();

        int selected_ = 0;
        int scroll_ = 0;
        int count_ = 0;
        int page_ = 10;
        bool filtering_ = false;
        std::string filter_;
    };

}

#endif
