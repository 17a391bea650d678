#ifndef _BK_BOKEH_H
#define _BK_BOKEH_H

// ============================================================================
// Bokeh blur: approximates a disc-shaped lens kernel by a weighted sum of
// complex Gaussian components, each applied as two 1-D passes.
//
//   encode (x^gamma) -> per-component separable convolution (parallel)
//   -> weighted reduction -> decode (x^(1/gamma), clamp [0,255])
//   -> optional mask write-back
//
// Preconditions (checked, in this order):
//   count == width * height, mask.size() == count     BK_ERR_DIMENSION
//   width, height >= 2 * sample_count + 1             BK_ERR_DIMENSION
//   non-empty finite table, radius > 0, samples >= 1  BK_ERR_CONFIG
//   gamma > 0 and every encoded sample finite         BK_ERR_NUMERIC
//
// Pixels are modified in place only when BK_OK is returned.
// ============================================================================

#include <cstddef>
#include <vector>

#include "params.h"
#include "types.h"

bk_status_e bokeh_blur(Vector4d *pixels, size_t count, int width, int height,
                       double radius, int sample_count, double gamma,
                       const kernel_params_s &params);

// As bokeh_blur, but only pixels with mask[p] == true receive the blurred
// value; the others keep their value from before the call.
bk_status_e bokeh_blur_masked(Vector4d *pixels, size_t count,
                              const std::vector<bool> &mask,
                              int width, int height,
                              double radius, int sample_count, double gamma,
                              const kernel_params_s &params);

bk_status_e bokeh_blur(rgba_image_s &img, double radius, int sample_count, double gamma,
                       const kernel_params_s &params);

bk_status_e bokeh_blur_masked(rgba_image_s &img, const std::vector<bool> &mask,
                              double radius, int sample_count, double gamma,
                              const kernel_params_s &params);

// Shared precondition check used by the blur entry points
bk_status_e check_blur_dimensions(size_t count, int width, int height, int sample_count);

#endif
