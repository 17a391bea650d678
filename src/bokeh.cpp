#include "bokeh.h"
#include "accumulate.h"
#include "gamma.h"
#include "mask.h"

#include <cmath>
#include <cstdio>

bk_status_e check_blur_dimensions(size_t count, int width, int height, int sample_count)
{
    if (width <= 0 || height <= 0)
    {
        fprintf(stderr, "ERROR: invalid image size %dx%d\n", width, height);
        return BK_ERR_DIMENSION;
    }
    if (count != (size_t)width * height)
    {
        fprintf(stderr, "ERROR: buffer holds %zu pixels, %dx%d needs %zu\n",
                count, width, height, (size_t)width * height);
        return BK_ERR_DIMENSION;
    }
    if (sample_count >= 1)
    {
        const long long support = 2LL * sample_count + 1;
        if (width < support || height < support)
        {
            fprintf(stderr, "ERROR: %dx%d image is smaller than the %lld-tap kernel\n",
                    width, height, support);
            return BK_ERR_DIMENSION;
        }
    }
    return BK_OK;
}

static bk_status_e check_blur_config(double radius, int sample_count,
                                     const kernel_params_s &params)
{
    if (sample_count < 1)
    {
        fprintf(stderr, "ERROR: sample count must be >= 1 (got %d)\n", sample_count);
        return BK_ERR_CONFIG;
    }
    // Only (i * radius)^2 reaches the kernel, so -r would silently act as r;
    // a non-positive radius is treated as a caller error instead
    if (!std::isfinite(radius) || radius <= 0.0)
    {
        fprintf(stderr, "ERROR: radius must be positive and finite (got %g)\n", radius);
        return BK_ERR_CONFIG;
    }
    return validate_kernel_params(params);
}

// Encode, convolve and reduce into `linear`; pixels are only read
static bk_status_e blur_linear(const Vector4d *pixels, int width, int height,
                               double radius, int sample_count, double gamma,
                               const kernel_params_s &params,
                               std::vector<Vector4d> &linear)
{
    bk_status_e status = check_blur_config(radius, sample_count, params);
    if (status != BK_OK)
        return status;

    if (!gamma_is_valid(gamma))
    {
        fprintf(stderr, "ERROR: gamma must be positive and finite (got %g)\n", gamma);
        return BK_ERR_NUMERIC;
    }

    // The family is built before encoding so that a malformed table is reported
    // as a configuration error even when the pixels would also fail to encode
    std::vector<complex_kernel_t> kernels;
    status = build_kernel_family(params, radius, sample_count, kernels);
    if (status != BK_OK)
        return status;

    complex_image_s encoded;
    status = gamma_encode(pixels, width, height, gamma, encoded);
    if (status != BK_OK)
        return status;

    accumulate_components(encoded, params, kernels, linear);
    return BK_OK;
}

bk_status_e bokeh_blur(Vector4d *pixels, size_t count, int width, int height,
                       double radius, int sample_count, double gamma,
                       const kernel_params_s &params)
{
    bk_status_e status = check_blur_dimensions(count, width, height, sample_count);
    if (status != BK_OK)
        return status;

    std::vector<Vector4d> linear;
    status = blur_linear(pixels, width, height, radius, sample_count, gamma, params, linear);
    if (status != BK_OK)
        return status;

#pragma omp parallel for
    for (long long i = 0; i < (long long)count; ++i)
        pixels[i] = gamma_decode_pixel(linear[i], gamma);

    return BK_OK;
}

bk_status_e bokeh_blur_masked(Vector4d *pixels, size_t count,
                              const std::vector<bool> &mask,
                              int width, int height,
                              double radius, int sample_count, double gamma,
                              const kernel_params_s &params)
{
    bk_status_e status = check_blur_dimensions(count, width, height, sample_count);
    if (status != BK_OK)
        return status;
    if (mask.size() != count)
    {
        fprintf(stderr, "ERROR: mask has %zu entries, image has %zu pixels\n",
                mask.size(), count);
        return BK_ERR_DIMENSION;
    }

    // TODO: only convolve pixels within sample_count of a masked-true pixel
    std::vector<Vector4d> linear;
    status = blur_linear(pixels, width, height, radius, sample_count, gamma, params, linear);
    if (status != BK_OK)
        return status;

#pragma omp parallel for
    for (long long i = 0; i < (long long)count; ++i)
    {
        if (mask[i])
            linear[i] = gamma_decode_pixel(linear[i], gamma);
    }

    return composite_masked(pixels, linear.data(), mask, count, pixels);
}

bk_status_e bokeh_blur(rgba_image_s &img, double radius, int sample_count, double gamma,
                       const kernel_params_s &params)
{
    return bokeh_blur(img.pixels.data(), img.pixels.size(), img.width, img.height,
                      radius, sample_count, gamma, params);
}

bk_status_e bokeh_blur_masked(rgba_image_s &img, const std::vector<bool> &mask,
                              double radius, int sample_count, double gamma,
                              const kernel_params_s &params)
{
    return bokeh_blur_masked(img.pixels.data(), img.pixels.size(), mask, img.width, img.height,
                             radius, sample_count, gamma, params);
}
