#pragma once

#include <QImage>

#include <expected>
#include <string>

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual bool is_available() const = 0;
    // Result fits in max_width x max_height with the aspect ratio preserved.
    virtual std::expected<QImage, std::string> capture_resized(int max_width, int max_height) = 0;
};
