#ifndef _BK_BLUR_CONFIG_H
#define _BK_BLUR_CONFIG_H

#include <string>
#include <unordered_map>

#include "params.h"

using config_map_t = std::unordered_map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Blur tool configuration: all tweakable parameters in one place
// ---------------------------------------------------------------------------
struct blur_config_s
{
    // Files
    std::string input_file;
    std::string output_file;
    std::string mask_file = "";   // empty = blur every pixel
    double mask_threshold = 127.5; // mask pixels brighter than this are blurred

    // "bokeh" or "gaussian"
    std::string mode = "bokeh";

    // Bokeh kernel
    double radius = 10.0;          // kernel radius in pixels
    int samples = 10;              // taps on each side of the centre
    double gamma = 3.0;            // exposure gamma (1 = linear)
    int components = 9;            // preset family 1..9
    std::string kernel_file = "";  // custom table, overrides `components`

    // Gaussian kernel (mode = gaussian)
    double sigma = 5.0;

    // Parallelism
    int threads = 0; // 0 = OpenMP default
};

// Read a key = value text file into kv.  Lines starting with # are comments.
// Returns false on file-open error.
bool load_blur_config(const char *path, config_map_t &kv);

// Apply every recognised key present in kv.  Values are clamped to their
// valid ranges; returns false on an unparsable number or an unknown mode.
bool apply_blur_config(const config_map_t &kv, blur_config_s &cfg);

// Resolve the kernel family: kernel_file if set, else preset `components`
bool resolve_kernel_params(const blur_config_s &cfg, kernel_params_s &params);

void print_blur_config(const blur_config_s &cfg);

#endif
