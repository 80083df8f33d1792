#ifndef DOCKWATCH_MODAL_HPP
#define DOCKWATCH_MODAL_HPP

#include "keys.hpp"

#include <string>
#include <vector>

namespace DockWatch {

    struct FormField {
        std::string label;
        std::string value;
        bool required = false;
    };

    // Confirmation or small form. While open it receives every key.
    class Modal {
    public:
        enum class Kind { Confirm, Form };
        enum class Result { Pending, Confirmed, Cancelled };

        static Modal confirm(std::string title, std::string message);
        static Modal form(std::string title, std::vector<FormField> fields);

        Result handle_key(const Key& key);

        Kind kind() const { return kind_; }
        Result result() const { return result_; }
        const std::string& title() const { return title_; }
        const std::string& message() const { return message_; }
        const std::vector<FormField>& fields() const { return fields_; }
        int focus() const { return focus_; }
        // Value of the field with `label`, empty when absent.
        std::string value(const std::string& label) const;
        // Set when enter was refused because a required field is empty.
        const std::string& error() const { return error_; }

    private:
        Modal() = default;
        Result handle_form_key(const Key& key);
        void move_focus(int delta);

        Kind kind_ = Kind::Confirm;
        Result result_ = Result::Pending;
        std::string title_;
        std::string message_;
        std::vector<FormField> fields_;
        int focus_ = 0;
        std::string error_;
    };

}

#endif
