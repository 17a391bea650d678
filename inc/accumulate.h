#ifndef _BK_ACCUMULATE_H
#define _BK_ACCUMULATE_H

#include <vector>

#include "kernel.h"
#include "types.h"

// Convolve `input` with every (already normalised) kernel of the family and
// fold the complex results into one real image:
//
//   out[p][c] = sum_n re_n * Re(filtered_n[p][c]) + im_n * Im(filtered_n[p][c])
//
// Components are filtered in parallel and each one is folded into `out` in
// component order as soon as its predecessors are done, so the result does
// not depend on scheduling and at most one filtered image per thread is
// alive.  With fewer components than threads the components run one after
// another and the convolution itself is parallelised over rows/columns.
// `out` is resized to input.num_pixels().
void accumulate_components(const complex_image_s &input,
                           const kernel_params_s &params,
                           const std::vector<complex_kernel_t> &kernels,
                           std::vector<Vector4d> &out);

// Builds and normalises the family, then accumulates
bk_status_e accumulate(const complex_image_s &input,
                       const kernel_params_s &params,
                       double radius, int sample_count,
                       std::vector<Vector4d> &out);

// Number of OpenMP threads used by the core (n <= 0 keeps the runtime default)
void set_thread_count(int n);
int thread_count();

#endif
