#include "kernel.h"

#include <cmath>
#include <cstdio>

complex_kernel_t build_complex_kernel(double radius, int sample_count, double a, double b)
{
    complex_kernel_t kernel(2 * (size_t)sample_count + 1, complex_t(0.0, 0.0));
    if (sample_count == 0)
    {
        kernel[0] = complex_t(1.0, 0.0);
        return kernel;
    }

    for (int i = -sample_count; i <= sample_count; ++i)
    {
        const double ax = i * radius / sample_count;
        const double ax2 = ax * ax;
        const double amp = std::exp(-a * ax2);
        kernel[i + sample_count] = complex_t(amp * std::cos(b * ax2), amp * std::sin(b * ax2));
    }
    return kernel;
}

double kernel_family_energy(const kernel_params_s &params,
                            const std::vector<complex_kernel_t> &kernels)
{
    double sum = 0.0;
    for (size_t n = 0; n < kernels.size(); ++n)
    {
        const double re = params.real_weight((int)n);
        const double im = params.imag_weight((int)n);
        const complex_kernel_t &k = kernels[n];

        for (const complex_t &ki : k)
        {
            for (const complex_t &kj : k)
            {
                sum += re * (ki.real() * kj.real() - ki.imag() * kj.imag()) +
                       im * (ki.real() * kj.imag() + ki.imag() * kj.real());
            }
        }
    }
    return sum;
}

bk_status_e normalize_kernel_family(const kernel_params_s &params,
                                    std::vector<complex_kernel_t> &kernels)
{
    const double energy = kernel_family_energy(params, kernels);
    if (!std::isfinite(energy) || energy <= 0.0)
    {
        fprintf(stderr, "ERROR: kernel family '%s' has degenerate energy %g\n",
                params.name.c_str(), energy);
        return BK_ERR_CONFIG;
    }

    const double norm = std::sqrt(energy);
    for (complex_kernel_t &k : kernels)
        for (complex_t &tap : k)
            tap /= norm;

    const double check = kernel_family_energy(params, kernels);
    if (!(std::abs(check - 1.0) <= BK_ENERGY_TOLERANCE))
    {
        fprintf(stderr, "ERROR: kernel family '%s' does not normalise (energy %.12f)\n",
                params.name.c_str(), check);
        return BK_ERR_CONFIG;
    }
    return BK_OK;
}

bk_status_e build_kernel_family(const kernel_params_s &params,
                                double radius, int sample_count,
                                std::vector<complex_kernel_t> &kernels)
{
    bk_status_e status = validate_kernel_params(params);
    if (status != BK_OK)
        return status;

    kernels.clear();
    kernels.reserve(params.components.size());
    for (const kernel_component_s &c : params.components)
        kernels.push_back(build_complex_kernel(radius, sample_count, c.a, c.b));

    return normalize_kernel_family(params, kernels);
}

std::vector<double> kernel_profile(const kernel_params_s &params,
                                   const std::vector<complex_kernel_t> &kernels)
{
    if (kernels.empty())
        return {};

    std::vector<double> profile(kernels[0].size(), 0.0);
    for (size_t n = 0; n < kernels.size(); ++n)
    {
        const double re = params.real_weight((int)n);
        const double im = params.imag_weight((int)n);
        for (size_t m = 0; m < kernels[n].size() && m < profile.size(); ++m)
            profile[m] += re * kernels[n][m].real() + im * kernels[n][m].imag();
    }
    return profile;
}
