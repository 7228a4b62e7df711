#include "image/scaling.hpp"

#include <format>

std::expected<QImage, std::string> scaled_to_fit(const QImage& image, int max_width, int max_height) {
    if (image.isNull()) return std::unexpected("cannot scale a null image");
    if (max_width <= 0 || max_height <= 0) {
        return std::unexpected(std::format("invalid target size {}x{}", max_width, max_height));
    }
    if (image.width() <= max_width && image.height() <= max_height) return image;

    QImage scaled = image.scaled(max_width, max_height, Qt::KeepAspectRatio, Qt::FastTransformation);
    if (scaled.isNull()) {
        return std::unexpected(std::format("scaling {}x{} to fit {}x{} failed",
                                           image.width(), image.height(), max_width, max_height));
    }
    return scaled;
}
