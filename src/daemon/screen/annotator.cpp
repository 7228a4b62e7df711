#include "screen/annotator.hpp"

#include "model/node_id.hpp"

#include <QBrush>
#include <QFont>
#include <QFontMetricsF>
#include <QGuiApplication>
#include <QPainter>
#include <QPen>
#include <QRectF>
#include <QString>

#include <algorithm>
#include <format>
#include <new>

namespace {

constexpr auto kCanvasFormat = QImage::Format_ARGB32_Premultiplied;

qreal scaled_px(float base, float density) {
    return std::max<qreal>(1.0, static_cast<qreal>(base) * static_cast<qreal>(density));
}

AnnotationError draw_failed(std::string message) {
    return AnnotationError{AnnotationError::Kind::DrawFailed, std::move(message)};
}

} // namespace

std::expected<QImage, AnnotationError> ScreenshotAnnotator::annotate(
    const QImage& source, std::span<const AnnotationTarget> targets,
    int screen_width, int screen_height) const {
    if (screen_width <= 0 || screen_height <= 0) {
        return std::unexpected(AnnotationError{
            AnnotationError::Kind::InvalidArgument,
            std::format("screen size must be positive, was {}x{}", screen_width, screen_height),
        });
    }
    if (source.isNull()) {
        return std::unexpected(AnnotationError{AnnotationError::Kind::InvalidArgument,
                                               "source image is null"});
    }

    try {
        QImage canvas = source.format() == kCanvasFormat ? source.copy()
                                                         : source.convertToFormat(kCanvasFormat);
        if (canvas.isNull()) return std::unexpected(draw_failed("could not allocate canvas"));
        if (targets.empty()) return canvas;

        if (!qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
            return std::unexpected(draw_failed("label text needs a QGuiApplication"));
        }

        const float scale_x = static_cast<float>(canvas.width()) / static_cast<float>(screen_width);
        const float scale_y = static_cast<float>(canvas.height()) / static_cast<float>(screen_height);
        const float density = static_cast<float>(canvas.width()) / kReferenceWidth;

        QPainter painter;
        if (!painter.begin(&canvas)) return std::unexpected(draw_failed("QPainter::begin failed"));
        painter.setRenderHint(QPainter::Antialiasing);
        painter.setRenderHint(QPainter::TextAntialiasing);

        for (const auto& target : targets) {
            auto box = compute_scaled_bounds(target.bounds, scale_x, scale_y,
                                             canvas.width(), canvas.height());
            if (!box) continue;
            draw_target(painter, *box, extract_label(target.id), density);
        }

        if (!painter.end()) return std::unexpected(draw_failed("QPainter::end failed"));
        return canvas;
    } catch (const std::bad_alloc&) {
        return std::unexpected(draw_failed("out of memory while annotating"));
    } catch (const std::exception& e) {
        return std::unexpected(draw_failed(e.what()));
    }
}

std::optional<ScaledBounds> ScreenshotAnnotator::compute_scaled_bounds(
    const Bounds& bounds, float scale_x, float scale_y, int bitmap_width, int bitmap_height) {
    const float w = static_cast<float>(bitmap_width);
    const float h = static_cast<float>(bitmap_height);
    float left = std::clamp(static_cast<float>(bounds.left) * scale_x, 0.0f, w);
    float top = std::clamp(static_cast<float>(bounds.top) * scale_y, 0.0f, h);
    float right = std::clamp(static_cast<float>(bounds.right) * scale_x, 0.0f, w);
    float bottom = std::clamp(static_cast<float>(bounds.bottom) * scale_y, 0.0f, h);

    if (right <= left || bottom <= top) return std::nullopt;
    return ScaledBounds{left, top, right, bottom};
}

std::string_view ScreenshotAnnotator::extract_label(std::string_view id) {
    if (id.starts_with(kNodeIdPrefix)) id.remove_prefix(kNodeIdPrefix.size());
    return id;
}

void ScreenshotAnnotator::draw_target(QPainter& painter, const ScaledBounds& box,
                                      std::string_view label, float density) const {
    const qreal stroke = scaled_px(kStrokeWidth, density);
    const qreal padding = scaled_px(kLabelPadding, density);
    const QRectF rect(QPointF(box.left, box.top), QPointF(box.right, box.bottom));

    // Dash pattern entries are in units of the pen width.
    QPen box_pen(QColor::fromRgba(kBoxColor));
    box_pen.setWidthF(stroke);
    box_pen.setCapStyle(Qt::FlatCap);
    box_pen.setJoinStyle(Qt::MiterJoin);
    box_pen.setDashPattern({scaled_px(kDashLength, density) / stroke,
                            scaled_px(kDashGap, density) / stroke});
    painter.setPen(box_pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rect);

    QFont font = painter.font();
    font.setBold(true);
    font.setPixelSize(std::max(1, qRound(kLabelTextSize * density)));
    painter.setFont(font);

    const QString text = QString::fromUtf8(label.data(), static_cast<qsizetype>(label.size()));
    const qreal text_width = QFontMetricsF(font).horizontalAdvance(text);
    const qreal text_height = font.pixelSize();

    QRectF chip(rect.left(), rect.top() - text_height - padding * 2,
                text_width + padding * 2, text_height + padding * 2);
    if (chip.top() < 0) chip.translate(0, -chip.top());

    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor::fromRgba(kLabelBackground));
    painter.drawRoundedRect(chip, padding, padding);

    painter.setPen(QColor::fromRgba(kLabelText));
    painter.drawText(QPointF(chip.left() + padding, chip.bottom() - padding), text);
}
