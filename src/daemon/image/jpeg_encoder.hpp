#pragma once

#include <QByteArray>
#include <QImage>

#include <expected>
#include <string>

namespace jpeg {

inline constexpr int kDefaultQuality = 80;

// Baseline JPEG of the RGB channels (alpha dropped). quality is clamped to 1..100.
std::expected<QByteArray, std::string> encode(const QImage& image, int quality = kDefaultQuality);

} // namespace jpeg
