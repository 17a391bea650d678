// ============================================================================
// bk-blur: bokeh (disc) or gaussian blur of an image file
//
// Reads an image (PNG/JPEG/TGA/BMP via stb, EXR via OpenEXR), blurs it with a
// sum-of-complex-Gaussians approximation of a disc kernel, and writes the
// result.  An optional mask image restricts which pixels are replaced.
//
// Usage:
//   bk-blur [config_file] [--key value ...]
//
// Output format is determined by file extension (.png .tga .bmp .jpg .hdr .exr)
// ============================================================================

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "accumulate.h"
#include "blur_config.h"
#include "bokeh.h"
#include "gaussian.h"
#include "image_io.h"
#include "params.h"

static void print_usage(const char *prog)
{
    printf("Usage: %s [config_file] [--key value ...]\n\n", prog);
    printf("Bokeh / gaussian image blur.\n\n");
    printf("The config file uses key = value format; lines starting with # are comments.\n\n");
    printf("Config keys:\n");
    printf("  input           Input image\n");
    printf("  output          Output image (.png .tga .bmp .jpg .hdr .exr)\n");
    printf("  mask            Mask image; bright pixels are blurred (default: none)\n");
    printf("  mask_threshold  Mask brightness cutoff 0-255 (default: 127.5)\n");
    printf("  mode            bokeh | gaussian (default: bokeh)\n");
    printf("  radius          Bokeh kernel radius (default: 10)\n");
    printf("  samples         Taps either side of centre (default: 10)\n");
    printf("  gamma           Exposure gamma, 1 = linear (default: 3)\n");
    printf("  components      Preset kernel family 1-9 (default: 9)\n");
    printf("  kernel_file     Custom kernel table, overrides components\n");
    printf("  sigma           Gaussian sigma, mode = gaussian (default: 5)\n");
    printf("  threads         Worker threads, 0 = all (default: 0)\n");
    printf("\nAll keys can also be passed as CLI overrides: --key value\n");
    printf("  e.g.: %s blur.conf --radius 25 --components 5\n", prog);
    printf("\n  --help          Print this help\n");
}

static bool parse_args(int argc, char *argv[], blur_config_s &cfg)
{
    const char *config_path = nullptr;
    config_map_t cli_kv;

    int i = 1;
    while (i < argc)
    {
        if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h"))
            return false;

        // CLI key-value override: --key value
        if (argv[i][0] == '-' && argv[i][1] == '-' && i + 1 < argc)
        {
            std::string key(argv[i] + 2);
            for (auto &c : key)
                if (c == '-')
                    c = '_';
            cli_kv[key] = argv[i + 1];
            i += 2;
        }
        else if (!config_path && argv[i][0] != '-')
        {
            config_path = argv[i];
            ++i;
        }
        else
        {
            fprintf(stderr, "ERROR: unexpected argument: %s\n", argv[i]);
            return false;
        }
    }

    config_map_t kv;
    if (config_path && !load_blur_config(config_path, kv))
        return false;

    // File config first, CLI overrides on top
    for (auto &pair : cli_kv)
        kv[pair.first] = pair.second;
    if (!apply_blur_config(kv, cfg))
        return false;

    if (cfg.input_file.empty())
    {
        fprintf(stderr, "ERROR: 'input' is required\n");
        return false;
    }
    if (cfg.output_file.empty())
    {
        fprintf(stderr, "ERROR: 'output' is required\n");
        return false;
    }
    return true;
}

int main(int argc, char *argv[])
{
    blur_config_s cfg;
    if (!parse_args(argc, argv, cfg))
    {
        print_usage(argv[0]);
        return 1;
    }

    printf("bk-blur: bokeh image blur\n");
    print_blur_config(cfg);

    set_thread_count(cfg.threads);
    printf("Threads: %d\n", thread_count());

    // --- Load inputs -----------------------------------------------------
    rgba_image_s img;
    if (!load_image(cfg.input_file.c_str(), img))
        return 1;

    std::vector<bool> mask;
    const bool use_mask = !cfg.mask_file.empty();
    if (use_mask && !load_mask(cfg.mask_file.c_str(), img.width, img.height,
                               cfg.mask_threshold, mask))
        return 1;

    auto t0 = std::chrono::steady_clock::now();

    // --- Blur ------------------------------------------------------------
    bk_status_e status = BK_OK;
    if (cfg.mode == "gaussian")
    {
        printf("Gaussian blur: sigma=%.3f, kernel radius=%d\n", cfg.sigma, cfg.samples);
        status = gaussian_blur(img, cfg.sigma, cfg.samples);
    }
    else
    {
        kernel_params_s params;
        if (!resolve_kernel_params(cfg, params))
            return 1;
        print_kernel_params(params);

        if (use_mask)
            status = bokeh_blur_masked(img, mask, cfg.radius, cfg.samples, cfg.gamma, params);
        else
            status = bokeh_blur(img, cfg.radius, cfg.samples, cfg.gamma, params);
    }

    if (status != BK_OK)
    {
        fprintf(stderr, "ERROR: blur failed: %s\n", bk_status_string(status));
        return 1;
    }

    auto t1 = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(t1 - t0).count();
    printf("Processing time: %.2f seconds\n", elapsed);

    // --- Write output ----------------------------------------------------
    if (!save_image(cfg.output_file.c_str(), img))
        return 1;

    return 0;
}
