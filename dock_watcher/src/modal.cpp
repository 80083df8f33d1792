#include "modal.hpp"

namespace DockWatch {

    Modal Modal::confirm(std::string title, std::string message) {
        Modal m;
        m.kind_ = Kind::Confirm;
        m.title_ = std::move(title);
        m.message_ = std::move(message);
        return m;
    }

    Modal Modal::form(std::string title, std::vector<FormField> fields) {
        Modal m;
        m.kind_ = Kind::Form;
        m.title_ = std::move(title);
        m.fields_ = std::move(fields);
        return m;
    }

    Modal::Result Modal::handle_key(const Key& key) {
        if (result_ != Result::Pending) return result_;

        if (kind_ == Kind::Form) {
            result_ = handle_form_key(key);
            return result_;
        }

        if (key.is("y") || key.is("Y") || key.is("enter")) result_ = Result::Confirmed;
        else if (key.is("n") || key.is("N") || key.is("esc")) result_ = Result::Cancelled;
        return result_;
    }

    Modal::Result Modal::handle_form_key(const Key& key) {
        if (key.is("esc")) return Result::Cancelled;

        if (key.is("tab") || key.is("down")) {
            move_focus(1);
            return Result::Pending;
        }
        if (key.is("shift+tab") || key.is("up")) {
            move_focus(-1);
            return Result::Pending;
        }

        if (key.is("enter")) {
            for (size_t i = 0; i < fields_.size(); ++i) {
                if (fields_[i].required && fields_[i].value.empty()) {
                    error_ = fields_[i].label + " is required";
                    focus_ = (int)i;
                    return Result::Pending;
                }
            }
            return Result::Confirmed;
        }

        if (fields_.empty()) return Result::Pending;
        FormField& field = fields_[focus_];
        if (key.is("backspace")) {
            if (!field.value.empty()) field.value.pop_back();
        } else if (key.printable) {
            field.value += key.name;
            error_.clear();
        }
        return Result::Pending;
    }

    void Modal::move_focus(int delta) {
        int n = (int)fields_.size();
        if (n == 0) return;
        focus_ = ((focus_ + delta) % n + n) % n;
    }

    std::string Modal::value(const std::string& label) const {
        for (const auto& f : fields_) {
            if (f.label == label) return f.value;
        }
        return "";
    }

}
