// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ImageDecoder.cpp
 * @brief libjpeg / libpng decode implementation
 */

#include "ImageDecoder.h"

#include <csetjmp>
#include <cstdio>

#include <jpeglib.h>
#include <png.h>

#define CL_LOG_TAG "Decoder"
#include "utils/Log.h"

namespace coverlight {
namespace image {

namespace {

// ============================================================================
// libjpeg error handling
// ============================================================================
// libjpeg reports fatal errors through error_exit, which must not return.
// We longjmp back into decodeJpeg() after capturing the message.

struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf jumpBuffer;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegErrorManager* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->jumpBuffer, 1);
}

void jpegOutputMessage(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    CL_EXTRACT_LOGD("libjpeg: %s", buffer);
}

bool decodeJpeg(const uint8_t* data, size_t length, RgbaImage& out, DecodeResult& result) {
    jpeg_decompress_struct cinfo;
    JpegErrorManager jerr;
    std::vector<uint8_t> row;

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpegErrorExit;
    jerr.pub.output_message = jpegOutputMessage;
    jerr.message[0] = '\0';

    if (setjmp(jerr.jumpBuffer)) {
        jpeg_destroy_decompress(&cinfo);
        result.status = DecodeStatus::CORRUPT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "JPEG decode failed: %s", jerr.message);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(length));
    jpeg_read_header(&cinfo, TRUE);

    const bool cmyk = (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK);
    cinfo.out_color_space = cmyk ? JCS_CMYK : JCS_RGB;

    jpeg_start_decompress(&cinfo);

    if (cinfo.output_width > MAX_DECODE_DIMENSION || cinfo.output_height > MAX_DECODE_DIMENSION) {
        result.status = DecodeStatus::TOO_LARGE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "JPEG too large: %ux%u",
                 static_cast<unsigned>(cinfo.output_width), static_cast<unsigned>(cinfo.output_height));
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    out.width = cinfo.output_width;
    out.height = cinfo.output_height;
    out.rgba.assign(out.pixelCount() * 4, 0);
    row.resize(static_cast<size_t>(cinfo.output_width) * cinfo.output_components);

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW rowPtr = row.data();
        const uint32_t y = cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, &rowPtr, 1);

        uint8_t* dst = &out.rgba[static_cast<size_t>(y) * out.width * 4];
        for (uint32_t x = 0; x < out.width; ++x) {
            const uint8_t* src = &row[static_cast<size_t>(x) * cinfo.output_components];
            if (cmyk) {
                // Adobe writes inverted CMYK: channel * K / 255 gives RGB
                dst[0] = static_cast<uint8_t>((src[0] * src[3]) / 255);
                dst[1] = static_cast<uint8_t>((src[1] * src[3]) / 255);
                dst[2] = static_cast<uint8_t>((src[2] * src[3]) / 255);
            } else {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
            dst[3] = 255;
            dst += 4;
        }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

// ============================================================================
// libpng simplified API
// ============================================================================

bool decodePng(const uint8_t* data, size_t length, RgbaImage& out, DecodeResult& result) {
    png_image image;
    memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, data, length)) {
        result.status = DecodeStatus::CORRUPT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "PNG header rejected: %s", image.message);
        png_image_free(&image);
        return false;
    }

    if (image.width > MAX_DECODE_DIMENSION || image.height > MAX_DECODE_DIMENSION) {
        result.status = DecodeStatus::TOO_LARGE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "PNG too large: %ux%u",
                 static_cast<unsigned>(image.width), static_cast<unsigned>(image.height));
        png_image_free(&image);
        return false;
    }

    image.format = PNG_FORMAT_RGBA;
    out.width = image.width;
    out.height = image.height;
    out.rgba.assign(PNG_IMAGE_SIZE(image), 0);

    if (!png_image_finish_read(&image, nullptr, out.rgba.data(), 0, nullptr)) {
        result.status = DecodeStatus::CORRUPT;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "PNG decode failed: %s", image.message);
        png_image_free(&image);
        return false;
    }
    return true;
}

} // namespace

const char* imageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG:  return "png";
        default:                return "unknown";
    }
}

ImageFormat detectFormat(const uint8_t* data, size_t length) {
    static const uint8_t PNG_MAGIC[8] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    if (data == nullptr) {
        return ImageFormat::UNKNOWN;
    }
    if (length >= sizeof(PNG_MAGIC) && memcmp(data, PNG_MAGIC, sizeof(PNG_MAGIC)) == 0) {
        return ImageFormat::PNG;
    }
    if (length >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    return ImageFormat::UNKNOWN;
}

DecodeResult decodeImage(const uint8_t* data, size_t length, RgbaImage& out) {
    DecodeResult result;

    if (data == nullptr || length == 0) {
        result.status = DecodeStatus::EMPTY;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No image bytes");
        return result;
    }

    result.format = detectFormat(data, length);
    bool ok = false;
    switch (result.format) {
        case ImageFormat::JPEG:
            ok = decodeJpeg(data, length, out, result);
            break;
        case ImageFormat::PNG:
            ok = decodePng(data, length, out, result);
            break;
        default:
            result.status = DecodeStatus::UNKNOWN_FORMAT;
            snprintf(result.errorMsg, MAX_ERROR_MSG,
                     "Unrecognized image format (%zu bytes, first byte 0x%02X)", length, data[0]);
            return result;
    }

    if (!ok) {
        CL_EXTRACT_LOGW("%s", result.errorMsg);
        return result;
    }

    result.success = true;
    result.status = DecodeStatus::OK;
    CL_EXTRACT_LOGD("Decoded %s %ux%u", imageFormatName(result.format),
                    static_cast<unsigned>(out.width), static_cast<unsigned>(out.height));
    return result;
}

} // namespace image
} // namespace coverlight
