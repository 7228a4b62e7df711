#include "image/jpeg_encoder.hpp"

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>

namespace jpeg {

namespace {

struct ErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

extern "C" void on_jpeg_error(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

} // namespace

std::expected<QByteArray, std::string> encode(const QImage& image, int quality) {
    if (image.isNull()) return std::unexpected("cannot encode a null image");

    // Created before setjmp: longjmp skips destructors.
    const QImage rgb = image.convertToFormat(QImage::Format_RGB888);
    if (rgb.isNull()) return std::unexpected("could not convert image to RGB");
    quality = std::clamp(quality, 1, 100);

    unsigned char* out_buf = nullptr;
    unsigned long out_size = 0;

    jpeg_compress_struct cinfo{};
    ErrorManager err{};
    cinfo.err = jpeg_std_error(&err.base);
    err.base.error_exit = on_jpeg_error;

    if (setjmp(err.jump)) {
        jpeg_destroy_compress(&cinfo);
        std::free(out_buf);
        return std::unexpected(std::string("libjpeg: ") + err.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &out_buf, &out_size);

    cinfo.image_width = static_cast<JDIMENSION>(rgb.width());
    cinfo.image_height = static_cast<JDIMENSION>(rgb.height());
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    // Format_RGB888 scanlines are packed R,G,B, which is what JCS_RGB expects.
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(rgb.constScanLine(static_cast<int>(cinfo.next_scanline)));
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    QByteArray out(reinterpret_cast<const char*>(out_buf), static_cast<qsizetype>(out_size));
    std::free(out_buf);
    return out;
}

} // namespace jpeg
