#include "blur_config.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Trim leading/trailing whitespace
// ---------------------------------------------------------------------------
static std::string trim(const std::string &s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool load_blur_config(const char *path, config_map_t &kv)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        fprintf(stderr, "ERROR: cannot open config file: %s\n", path);
        return false;
    }

    std::string line;
    while (std::getline(file, line))
    {
        // Strip comments
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        line = trim(line);
        if (line.empty())
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (!key.empty() && !val.empty())
            kv[key] = val;
    }
    return true;
}

bool apply_blur_config(const config_map_t &kv, blur_config_s &cfg)
{
    bool ok = true;

    auto get_string = [&](const char *key, std::string &out)
    {
        auto it = kv.find(key);
        if (it != kv.end())
            out = it->second;
    };
    auto get_int = [&](const char *key, int &out)
    {
        auto it = kv.find(key);
        if (it == kv.end())
            return;
        try
        {
            size_t used = 0;
            const int v = std::stoi(it->second, &used);
            if (used != it->second.size())
                throw std::invalid_argument("trailing characters");
            out = v;
        }
        catch (const std::exception &)
        {
            fprintf(stderr, "ERROR: '%s' expects an integer, got '%s'\n", key, it->second.c_str());
            ok = false;
        }
    };
    auto get_double = [&](const char *key, double &out)
    {
        auto it = kv.find(key);
        if (it == kv.end())
            return;
        try
        {
            size_t used = 0;
            const double v = std::stod(it->second, &used);
            if (used != it->second.size())
                throw std::invalid_argument("trailing characters");
            out = v;
        }
        catch (const std::exception &)
        {
            fprintf(stderr, "ERROR: '%s' expects a number, got '%s'\n", key, it->second.c_str());
            ok = false;
        }
    };

    // Files
    get_string("input", cfg.input_file);
    get_string("output", cfg.output_file);
    get_string("mask", cfg.mask_file);
    get_double("mask_threshold", cfg.mask_threshold);

    get_string("mode", cfg.mode);
    if (cfg.mode != "bokeh" && cfg.mode != "gaussian")
    {
        fprintf(stderr, "ERROR: mode must be 'bokeh' or 'gaussian', got '%s'\n", cfg.mode.c_str());
        ok = false;
    }

    // Bokeh kernel
    get_double("radius", cfg.radius);
    get_int("samples", cfg.samples);
    get_double("gamma", cfg.gamma);
    get_int("components", cfg.components);
    get_string("kernel_file", cfg.kernel_file);

    // Gaussian kernel
    get_double("sigma", cfg.sigma);

    get_int("threads", cfg.threads);

    // Clamp
    cfg.samples = std::max(1, cfg.samples);
    cfg.components = std::clamp(cfg.components, BK_MIN_PRESET, BK_MAX_PRESET);
    cfg.threads = std::max(0, cfg.threads);

    return ok;
}

bool resolve_kernel_params(const blur_config_s &cfg, kernel_params_s &params)
{
    if (!cfg.kernel_file.empty())
        return load_kernel_params(cfg.kernel_file.c_str(), params);

    const kernel_params_s *preset = kernel_params_preset(cfg.components);
    if (!preset)
    {
        fprintf(stderr, "ERROR: no preset with %d components\n", cfg.components);
        return false;
    }
    params = *preset;
    return true;
}

// ---------------------------------------------------------------------------
// Pretty-print the config
// ---------------------------------------------------------------------------
void print_blur_config(const blur_config_s &cfg)
{
    printf("=== Blur Configuration ===\n");
    printf("  Input:     %s\n", cfg.input_file.c_str());
    printf("  Output:    %s\n", cfg.output_file.c_str());
    if (!cfg.mask_file.empty())
        printf("  Mask:      %s  threshold=%.1f\n", cfg.mask_file.c_str(), cfg.mask_threshold);
    printf("  Mode:      %s\n", cfg.mode.c_str());
    if (cfg.mode == "gaussian")
    {
        printf("  Gaussian:  sigma=%.3f  kernel_radius=%d\n", cfg.sigma, cfg.samples);
    }
    else
    {
        printf("  Bokeh:     radius=%.3f  samples=%d  gamma=%.2f\n",
               cfg.radius, cfg.samples, cfg.gamma);
        if (!cfg.kernel_file.empty())
            printf("  Kernel:    %s\n", cfg.kernel_file.c_str());
        else
            printf("  Kernel:    preset %d\n", cfg.components);
    }
    if (cfg.threads > 0)
        printf("  Threads:   %d\n", cfg.threads);
    else
        printf("  Threads:   default\n");
    printf("==========================\n");
}
