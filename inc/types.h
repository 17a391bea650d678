#ifndef _BK_TYPES_H
#define _BK_TYPES_H

#include <cstddef>
#include <vector>

#include "common.h"

// Result of every core entry point.  Anything other than BK_OK means the call
// was rejected before the caller's buffer was touched.
enum bk_status_e
{
    BK_OK = 0,
    BK_ERR_CONFIG,    // empty / malformed parameter table, bad radius or sample count
    BK_ERR_DIMENSION, // buffer or mask length mismatch, kernel larger than the image
    BK_ERR_NUMERIC,   // gamma <= 0 or non-finite encoded samples
};

const char *bk_status_string(bk_status_e status);

// Interleaved RGBA image with channel values conventionally in [0, 255]
struct rgba_image_s
{
    int width = 0;
    int height = 0;
    std::vector<Vector4d> pixels;

    size_t num_pixels() const { return (size_t)width * height; }

    Vector4d &at(int x, int y) { return pixels[(size_t)y * width + x]; }
    const Vector4d &at(int x, int y) const { return pixels[(size_t)y * width + x]; }
};

// Same layout with one complex value per channel
struct complex_image_s
{
    int width = 0;
    int height = 0;
    std::vector<Vector4cd> pixels;

    complex_image_s() = default;
    complex_image_s(int w, int h)
        : width(w), height(h), pixels((size_t)w * h, Vector4cd::Zero())
    {
    }

    size_t num_pixels() const { return (size_t)width * height; }
};

#endif
