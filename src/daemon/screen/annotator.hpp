#pragma once

#include "screen/compact_serializer.hpp"

#include <QColor>
#include <QImage>

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

class QPainter;

struct AnnotationError {
    enum class Kind { InvalidArgument, DrawFailed };
    Kind kind;
    std::string message;
};

struct ScaledBounds {
    float left;
    float top;
    float right;
    float bottom;
};

// Draws set-of-mark style boxes and id labels on a copy of a screenshot:
// red dashed outline per element and a translucent red chip holding the
// element id without its "node_" prefix. Sizes are in reference pixels of a
// 360 px wide screen and scale with the image width.
class ScreenshotAnnotator {
public:
    static constexpr float kReferenceWidth = 360.0f;
    static constexpr float kStrokeWidth = 2.0f;
    static constexpr float kDashLength = 6.0f;
    static constexpr float kDashGap = 3.0f;
    static constexpr float kLabelPadding = 2.0f;
    static constexpr float kLabelTextSize = 10.0f;
    static constexpr QRgb kBoxColor = qRgba(255, 0, 0, 255);
    static constexpr QRgb kLabelBackground = qRgba(255, 0, 0, 180);
    static constexpr QRgb kLabelText = qRgba(255, 255, 255, 255);

    // source is never modified. screen_width/screen_height are the dimensions
    // the target bounds were measured against. Needs a QGuiApplication for
    // label text.
    std::expected<QImage, AnnotationError> annotate(const QImage& source,
                                                    std::span<const AnnotationTarget> targets,
                                                    int screen_width, int screen_height) const;

    // Scaled and clamped to [0,w] x [0,h]; nullopt when nothing is left.
    static std::optional<ScaledBounds> compute_scaled_bounds(const Bounds& bounds,
                                                             float scale_x, float scale_y,
                                                             int bitmap_width, int bitmap_height);

    static std::string_view extract_label(std::string_view id);

private:
    void draw_target(QPainter& painter, const ScaledBounds& box, std::string_view label,
                     float density) const;
};
