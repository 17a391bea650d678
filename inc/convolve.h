#ifndef _BK_CONVOLVE_H
#define _BK_CONVOLVE_H

#include "kernel.h"
#include "types.h"

// ---------------------------------------------------------------------------
// 1-D complex convolution along one image axis.
//
// out[p] = sum over taps t of in[p + t - half] * kernel[t], per channel.
// Taps whose source falls outside the image are dropped; the partial sum is
// NOT renormalised, so pixels within `half` of an edge come out
// under-weighted.  Output is resized to the input dimensions.
//
// Rows (horizontal) and columns (vertical) are split over OpenMP threads.
// Called from inside an active parallel region the loops run serially on
// the calling thread.
// ---------------------------------------------------------------------------
void horizontal_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                       complex_image_s &output);

void vertical_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                     complex_image_s &output);

// Full 2-D pass of one component: vertical(horizontal(input))
void separable_filter(const complex_image_s &input, const complex_kernel_t &kernel,
                      complex_image_s &output);

#endif
