#pragma once

#include <string>

// The window toolkit side of the application. Both calls are fire-and-forget:
// the caller never learns whether the file actually rendered.
class UiLayer {
public:
    virtual ~UiLayer() = default;
    // Load the file into the main view and bring the window to front.
    virtual void open(const std::string& path) = 0;
    virtual void focus() = 0;
};
