#pragma once

#include <QImage>

#include <expected>
#include <string>

// Nearest-neighbour downscale so the image fits in max_width x max_height with
// the aspect ratio kept. Images that already fit come back unchanged.
std::expected<QImage, std::string> scaled_to_fit(const QImage& image, int max_width, int max_height);
