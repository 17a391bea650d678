#ifndef _BK_GAUSSIAN_H
#define _BK_GAUSSIAN_H

#include <cstddef>
#include <vector>

#include "types.h"

// Normalised (taps sum to 1) Gaussian of 2*kernel_radius+1 taps
std::vector<double> gaussian_kernel(double sigma, int kernel_radius);

// Plain separable Gaussian blur, horizontal then vertical, in place.
// Uses the same border policy as the bokeh convolver: out-of-image taps are
// dropped and the sum is not renormalised.
bk_status_e gaussian_blur(Vector4d *pixels, size_t count, int width, int height,
                          double sigma, int kernel_radius);

bk_status_e gaussian_blur(rgba_image_s &img, double sigma, int kernel_radius);

#endif
