#include "gamma.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

Vector4d gamma_encode_pixel(const Vector4d &pixel, double gamma)
{
    if (gamma == 1.0)
        return pixel;

    Vector4d out;
    for (int c = 0; c < BK_CHANNELS; ++c)
        out[c] = std::pow(pixel[c], gamma);
    return out;
}

Vector4d gamma_decode_pixel(const Vector4d &pixel, double gamma)
{
    Vector4d out;
    for (int c = 0; c < BK_CHANNELS; ++c)
    {
        // Ringing at the borders can push the linear sum slightly negative
        double v = std::max(pixel[c], 0.0);
        if (gamma != 1.0)
            v = std::pow(v, 1.0 / gamma);
        out[c] = std::clamp(v, 0.0, BK_CHANNEL_MAX);
    }
    return out;
}

bool gamma_is_valid(double gamma)
{
    return std::isfinite(gamma) && gamma > 0.0;
}

bk_status_e gamma_encode(const Vector4d *pixels, int width, int height, double gamma,
                         complex_image_s &out)
{
    if (!gamma_is_valid(gamma))
    {
        fprintf(stderr, "ERROR: gamma must be positive and finite (got %g)\n", gamma);
        return BK_ERR_NUMERIC;
    }

    out = complex_image_s(width, height);
    const long long num_px = (long long)out.num_pixels();
    bool finite = true;

#pragma omp parallel for reduction(&& : finite)
    for (long long i = 0; i < num_px; ++i)
    {
        const Vector4d enc = gamma_encode_pixel(pixels[i], gamma);
        finite = finite && enc.allFinite();
        out.pixels[i] = enc.cast<complex_t>();
    }

    if (!finite)
    {
        fprintf(stderr, "ERROR: gamma %g produced non-finite encoded samples\n", gamma);
        return BK_ERR_NUMERIC;
    }
    return BK_OK;
}
