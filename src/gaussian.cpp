#include "gaussian.h"
#include "bokeh.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#ifdef _OPENMP
#include <omp.h>
#endif

static inline double gaussian(double x, double sigma)
{
    return std::exp(-(x * x) / (2.0 * sigma * sigma)) / (std::sqrt(2.0 * M_PI) * sigma);
}

std::vector<double> gaussian_kernel(double sigma, int kernel_radius)
{
    std::vector<double> kernel(2 * (size_t)kernel_radius + 1, 0.0);
    double sum = 0.0;
    for (int i = -kernel_radius; i <= kernel_radius; ++i)
    {
        const double v = gaussian((double)i, sigma);
        kernel[i + kernel_radius] = v;
        sum += v;
    }
    for (double &v : kernel)
        v /= sum;
    return kernel;
}

bk_status_e gaussian_blur(Vector4d *pixels, size_t count, int width, int height,
                          double sigma, int kernel_radius)
{
    bk_status_e status = check_blur_dimensions(count, width, height, kernel_radius);
    if (status != BK_OK)
        return status;
    if (kernel_radius < 1)
    {
        fprintf(stderr, "ERROR: kernel radius must be >= 1 (got %d)\n", kernel_radius);
        return BK_ERR_CONFIG;
    }
    if (!std::isfinite(sigma) || sigma <= 0.0)
    {
        fprintf(stderr, "ERROR: sigma must be positive and finite (got %g)\n", sigma);
        return BK_ERR_CONFIG;
    }

    const std::vector<double> kernel = gaussian_kernel(sigma, kernel_radius);
    const int taps = (int)kernel.size();
    const int half = kernel_radius;
    const int w = width;
    const int h = height;

    std::vector<Vector4d> tmp(count, Vector4d::Zero());

    // ---- Horizontal pass ----
#pragma omp parallel for
    for (int y = 0; y < h; ++y)
    {
        const size_t row = (size_t)y * w;
        for (int x = 0; x < w; ++x)
        {
            const int first = std::max(0, half - x);
            const int last = std::min(taps - 1, w - 1 - x + half);

            Vector4d sum = Vector4d::Zero();
            for (int t = first; t <= last; ++t)
                sum += kernel[t] * pixels[row + x + t - half];
            tmp[row + x] = sum;
        }
    }

    // ---- Vertical pass ----
#pragma omp parallel for
    for (int x = 0; x < w; ++x)
    {
        for (int y = 0; y < h; ++y)
        {
            const int first = std::max(0, half - y);
            const int last = std::min(taps - 1, h - 1 - y + half);

            Vector4d sum = Vector4d::Zero();
            for (int t = first; t <= last; ++t)
                sum += kernel[t] * tmp[(size_t)(y + t - half) * w + x];
            pixels[(size_t)y * w + x] = sum;
        }
    }

    return BK_OK;
}

bk_status_e gaussian_blur(rgba_image_s &img, double sigma, int kernel_radius)
{
    return gaussian_blur(img.pixels.data(), img.pixels.size(), img.width, img.height,
                         sigma, kernel_radius);
}
