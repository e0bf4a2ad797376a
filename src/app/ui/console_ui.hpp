#pragma once

#include "ui/ui_layer.hpp"

#include <cstdio>

// Headless stand-in for the window layer: reports each request on a stream.
class ConsoleUi : public UiLayer {
public:
    explicit ConsoleUi(std::FILE* out = stdout) : out_(out) {}

    void open(const std::string& path) override;
    void focus() override;

private:
    std::FILE* out_;
};
