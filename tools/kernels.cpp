// bk-kernels: writes the real cross-section of every preset kernel family
//
// Usage:  bk-kernels [out_dir]      (default: plots)
//
// For each preset n in 1..9 and sample count s in {1, 5, 10, 50, 100}
// writes <out_dir>/<n>_<s>.txt containing "[v0, v1, ...]" (radius 1).

#include <cstdio>
#include <string>
#include <vector>

#include "kernel.h"
#include "params.h"

static bool write_profile(const std::string &path, const std::vector<double> &profile)
{
    FILE *f = fopen(path.c_str(), "w");
    if (!f)
    {
        fprintf(stderr, "ERROR: cannot open %s for writing\n", path.c_str());
        return false;
    }

    fprintf(f, "[");
    for (size_t i = 0; i < profile.size(); ++i)
        fprintf(f, "%s%.17g", i ? ", " : "", profile[i]);
    fprintf(f, "]\n");

    if (fclose(f) != 0)
    {
        fprintf(stderr, "ERROR: failed writing %s\n", path.c_str());
        return false;
    }
    return true;
}

int main(int argc, char *argv[])
{
    const std::string out_dir = (argc > 1) ? argv[1] : "plots";
    static const int sample_counts[] = {1, 5, 10, 50, 100};

    int written = 0;
    for (int n = BK_MIN_PRESET; n <= BK_MAX_PRESET; ++n)
    {
        const kernel_params_s *params = kernel_params_preset(n);
        for (int samples : sample_counts)
        {
            std::vector<complex_kernel_t> kernels;
            if (build_kernel_family(*params, 1.0, samples, kernels) != BK_OK)
                return 1;

            const std::string path = out_dir + "/" + std::to_string(n) + "_" +
                                     std::to_string(samples) + ".txt";
            if (!write_profile(path, kernel_profile(*params, kernels)))
                return 1;
            ++written;
        }
    }

    printf("Wrote %d kernel profiles to %s\n", written, out_dir.c_str());
    return 0;
}
