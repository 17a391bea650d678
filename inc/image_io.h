#ifndef _BK_IMAGE_IO_H
#define _BK_IMAGE_IO_H

#include <vector>

#include "types.h"

// Decode an image file to RGBA with channels in [0, 255].
//   .exr                   float R,G,B,(A) scaled by 255 (needs OpenEXR)
//   anything else          8-bit via stb_image (PNG, JPEG, TGA, BMP, ...)
bool load_image(const char *path, rgba_image_s &img);

// Encode by extension: .png .tga .bmp .jpg (8-bit), .hdr (float RGB / 255),
// .exr (float RGBA / 255, needs OpenEXR)
bool save_image(const char *path, const rgba_image_s &img);

// Load a mask image of exactly width x height.  A pixel is selected where
// the mean of its R, G, B channels exceeds threshold.
bool load_mask(const char *path, int width, int height, double threshold,
               std::vector<bool> &mask);

#endif
