#pragma once

#include "model/window.hpp"

class ScreenMetadata {
public:
    virtual ~ScreenMetadata() = default;
    virtual ScreenInfo current_screen_info() const = 0;
};
