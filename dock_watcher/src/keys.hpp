#ifndef DOCKWATCH_KEYS_HPP
#define DOCKWATCH_KEYS_HPP

#include <string>

namespace DockWatch {

    // Terminal-independent key press. Printable keys carry their text as the
    // name ("q", "/", "G"); the rest use fixed names:
    // enter esc tab shift+tab backspace delete up down left right
    // home end pgup pgdn ctrl+c ctrl+s
    struct Key {
        std::string name;
        bool printable = false;

        static Key rune(std::string text) { return Key{std::move(text), true}; }
        static Key named(std::string name) { return Key{std::move(name), false}; }

        bool is(const char* n) const { return name == n; }
    };

}

#endif
