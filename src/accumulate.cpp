#include "accumulate.h"
#include "convolve.h"

#ifdef _OPENMP
#include <omp.h>
#endif

void accumulate_components(const complex_image_s &input,
                           const kernel_params_s &params,
                           const std::vector<complex_kernel_t> &kernels,
                           std::vector<Vector4d> &out)
{
    const int num_kernels = (int)kernels.size();
    const size_t num_px = input.num_pixels();

    out.assign(num_px, Vector4d::Zero());

    // Small families leave the component loop inactive so that the row and
    // column loops inside separable_filter get the whole team
    const bool per_component = num_kernels >= thread_count();

#pragma omp parallel for ordered schedule(static, 1) if (per_component)
    for (int n = 0; n < num_kernels; ++n)
    {
        complex_image_s filtered;
        separable_filter(input, kernels[n], filtered);

        const double re = params.real_weight(n);
        const double im = params.imag_weight(n);

        // Fold in component order
#pragma omp ordered
        {
            for (size_t i = 0; i < num_px; ++i)
            {
                const Vector4cd &px = filtered.pixels[i];
                out[i] += re * px.real() + im * px.imag();
            }
        }
    }
}

bk_status_e accumulate(const complex_image_s &input,
                       const kernel_params_s &params,
                       double radius, int sample_count,
                       std::vector<Vector4d> &out)
{
    std::vector<complex_kernel_t> kernels;
    bk_status_e status = build_kernel_family(params, radius, sample_count, kernels);
    if (status != BK_OK)
        return status;

    accumulate_components(input, params, kernels, out);
    return BK_OK;
}

void set_thread_count(int n)
{
#ifdef _OPENMP
    if (n > 0)
        omp_set_num_threads(n);
#else
    (void)n;
#endif
}

int thread_count()
{
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}
