#include "ui/console_ui.hpp"

#include <print>

void ConsoleUi::open(const std::string& path) {
    std::println(out_, "open {}", path);
    std::fflush(out_);
}

void ConsoleUi::focus() {
    std::println(out_, "focus");
    std::fflush(out_);
}
