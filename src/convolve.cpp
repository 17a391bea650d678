#include "convolve.h"

#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

// Range of kernel taps [first, last] whose source index pos + t - half lies
// in [0, extent).  Empty (first > last) only when the kernel misses entirely.
static inline void tap_range(int pos, int half, int taps, int extent, int &first, int &last)
{
    first = std::max(0, half - pos);
    last = std::min(taps - 1, extent - 1 - pos + half);
}

void horizontal_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                       complex_image_s &output)
{
    const int w = input.width;
    const int h = input.height;
    const int taps = (int)kernel.size();
    const int half = taps / 2;

    if (output.width != w || output.height != h || output.pixels.size() != input.pixels.size())
        output = complex_image_s(w, h);

#pragma omp parallel for
    for (int y = 0; y < h; ++y)
    {
        const Vector4cd *src = input.pixels.data() + (size_t)y * w;
        Vector4cd *dst = output.pixels.data() + (size_t)y * w;

        for (int x = 0; x < w; ++x)
        {
            int first, last;
            tap_range(x, half, taps, w, first, last);

            Vector4cd sum = Vector4cd::Zero();
            for (int t = first; t <= last; ++t)
                sum += src[x + t - half] * kernel[t];
            dst[x] = sum;
        }
    }
}

void vertical_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                     complex_image_s &output)
{
    const int w = input.width;
    const int h = input.height;
    const int taps = (int)kernel.size();
    const int half = taps / 2;

    if (output.width != w || output.height != h || output.pixels.size() != input.pixels.size())
        output = complex_image_s(w, h);

#pragma omp parallel for
    for (int x = 0; x < w; ++x)
    {
        for (int y = 0; y < h; ++y)
        {
            int first, last;
            tap_range(y, half, taps, h, first, last);

            Vector4cd sum = Vector4cd::Zero();
            for (int t = first; t <= last; ++t)
                sum += input.pixels[(size_t)(y + t - half) * w + x] * kernel[t];
            output.pixels[(size_t)y * w + x] = sum;
        }
    }
}

void separable_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                      complex_image_s &output)
{
    complex_image_s tmp(input.width, input.height);
    horizontal_filter(input, kernel, tmp);
    vertical_filter(tmp, kernel, output);
}
