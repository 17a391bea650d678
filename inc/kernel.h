#ifndef _BK_KERNEL_H
#define _BK_KERNEL_H

#include <vector>

#include "params.h"

// 1-D complex kernel, taps for offsets [-sample_count, sample_count]
using complex_kernel_t = std::vector<complex_t>;

// Absolute tolerance on the family energy after normalisation
#define BK_ENERGY_TOLERANCE 1e-9

// Build one UNNORMALISED complex Gaussian kernel of 2*sample_count+1 taps.
// Tap i samples the continuous kernel at x = i * radius / sample_count.
// sample_count == 0 yields the single tap 1+0i.
complex_kernel_t build_complex_kernel(double radius, int sample_count, double a, double b);

// Weighted self/cross energy of a family:
//   S = sum_n sum_i sum_j re_n*(Re_i Re_j - Im_i Im_j) + im_n*(Re_i Im_j + Im_i Re_j)
double kernel_family_energy(const kernel_params_s &params,
                            const std::vector<complex_kernel_t> &kernels);

// Divide every tap of every kernel by sqrt(S) so that S becomes 1.
// S non-finite or <= 0, or a post-normalisation energy further than
// BK_ENERGY_TOLERANCE from 1, is BK_ERR_CONFIG (kernels left untouched in
// the first case).
bk_status_e normalize_kernel_family(const kernel_params_s &params,
                                    std::vector<complex_kernel_t> &kernels);

// Build and jointly normalise one kernel per component of params
bk_status_e build_kernel_family(const kernel_params_s &params,
                                double radius, int sample_count,
                                std::vector<complex_kernel_t> &kernels);

// Real cross-section of the approximated disc:
//   p[m] = sum_n re_n * Re(k_n[m]) + im_n * Im(k_n[m])
std::vector<double> kernel_profile(const kernel_params_s &params,
                                   const std::vector<complex_kernel_t> &kernels);

#endif
