#ifndef _BK_GAMMA_H
#define _BK_GAMMA_H

#include <cstddef>

#include "types.h"

// Per-channel x^gamma.  gamma == 1 returns the pixel unchanged.
Vector4d gamma_encode_pixel(const Vector4d &pixel, double gamma);

// Per-channel max(x, 0)^(1/gamma) clamped to [0, BK_CHANNEL_MAX].
// gamma == 1 skips the root and only clamps.
Vector4d gamma_decode_pixel(const Vector4d &pixel, double gamma);

// gamma > 0 and finite
bool gamma_is_valid(double gamma);

// Encode `count` pixels into the real parts of a width x height complex image.
// Invalid gamma or any non-finite encoded sample is BK_ERR_NUMERIC.
bk_status_e gamma_encode(const Vector4d *pixels, int width, int height, double gamma,
                         complex_image_s &out);

#endif
