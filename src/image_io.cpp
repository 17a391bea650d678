#include "image_io.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#ifdef HAS_OPENEXR
#include <OpenEXR/ImfChannelList.h>
#include <OpenEXR/ImfFrameBuffer.h>
#include <OpenEXR/ImfHeader.h>
#include <OpenEXR/ImfInputFile.h>
#include <OpenEXR/ImfOutputFile.h>
#endif

static bool ends_with(const std::string &s, const char *suffix)
{
    size_t len = strlen(suffix);
    if (s.size() < len)
        return false;
    for (size_t i = 0; i < len; ++i)
    {
        if (tolower((unsigned char)s[s.size() - len + i]) != suffix[i])
            return false;
    }
    return true;
}

// ============================================================================
// EXR I/O
// ============================================================================

#ifdef HAS_OPENEXR
static bool load_exr(const char *path, rgba_image_s &img)
{
    try
    {
        Imf::InputFile file(path);
        const Imf::Header &hdr = file.header();

        Imath::Box2i dw = hdr.dataWindow();
        const int width = dw.max.x - dw.min.x + 1;
        const int height = dw.max.y - dw.min.y + 1;
        const size_t np = (size_t)width * height;

        const Imf::ChannelList &ch_list = hdr.channels();
        static const char *names[BK_CHANNELS] = {"R", "G", "B", "A"};

        // Missing colour channels stay 0, missing alpha is opaque
        std::vector<float> planes[BK_CHANNELS];
        for (int c = 0; c < BK_CHANNELS; ++c)
            planes[c].assign(np, c == 3 ? 1.0f : 0.0f);

        Imf::FrameBuffer fb;
        int found = 0;
        for (int c = 0; c < BK_CHANNELS; ++c)
        {
            if (!ch_list.findChannel(names[c]))
                continue;
            ++found;
            fb.insert(names[c],
                      Imf::Slice(Imf::FLOAT,
                                 (char *)(planes[c].data() - (ptrdiff_t)dw.min.x - (ptrdiff_t)dw.min.y * width),
                                 sizeof(float),
                                 sizeof(float) * width));
        }
        if (found == 0)
        {
            fprintf(stderr, "ERROR: EXR has no R, G, B or A channel: %s\n", path);
            return false;
        }

        file.setFrameBuffer(fb);
        file.readPixels(dw.min.y, dw.max.y);

        img.width = width;
        img.height = height;
        img.pixels.resize(np);
        for (size_t i = 0; i < np; ++i)
        {
            img.pixels[i] = Vector4d(planes[0][i], planes[1][i], planes[2][i], planes[3][i]) *
                            BK_CHANNEL_MAX;
        }

        printf("Loaded EXR: %s  (%dx%d)\n", path, width, height);
        return true;
    }
    catch (const std::exception &e)
    {
        fprintf(stderr, "ERROR loading EXR: %s (%s)\n", path, e.what());
        return false;
    }
}

static bool save_exr(const char *path, const rgba_image_s &img)
{
    try
    {
        const size_t np = img.num_pixels();
        static const char *names[BK_CHANNELS] = {"R", "G", "B", "A"};

        std::vector<float> planes[BK_CHANNELS];
        for (int c = 0; c < BK_CHANNELS; ++c)
        {
            planes[c].resize(np);
            for (size_t i = 0; i < np; ++i)
                planes[c][i] = (float)(img.pixels[i][c] / BK_CHANNEL_MAX);
        }

        Imf::Header header(img.width, img.height);
        for (int c = 0; c < BK_CHANNELS; ++c)
            header.channels().insert(names[c], Imf::Channel(Imf::FLOAT));

        Imf::FrameBuffer fb;
        for (int c = 0; c < BK_CHANNELS; ++c)
        {
            fb.insert(names[c],
                      Imf::Slice(Imf::FLOAT,
                                 (char *)planes[c].data(),
                                 sizeof(float),
                                 sizeof(float) * img.width));
        }

        Imf::OutputFile file(path, header);
        file.setFrameBuffer(fb);
        file.writePixels(img.height);

        printf("Wrote EXR: %s\n", path);
        return true;
    }
    catch (const std::exception &e)
    {
        fprintf(stderr, "ERROR writing EXR: %s (%s)\n", path, e.what());
        return false;
    }
}
#endif

// ============================================================================
// stb I/O
// ============================================================================

bool load_image(const char *path, rgba_image_s &img)
{
    if (ends_with(path, ".exr"))
    {
#ifdef HAS_OPENEXR
        return load_exr(path, img);
#else
        fprintf(stderr, "ERROR: built without OpenEXR, cannot read %s\n", path);
        return false;
#endif
    }

    int width = 0, height = 0, channels = 0;
    unsigned char *rgba = stbi_load(path, &width, &height, &channels, BK_CHANNELS);
    if (!rgba)
    {
        fprintf(stderr, "ERROR loading image: %s (%s)\n", path, stbi_failure_reason());
        return false;
    }

    const size_t np = (size_t)width * height;
    img.width = width;
    img.height = height;
    img.pixels.resize(np);
    for (size_t i = 0; i < np; ++i)
    {
        img.pixels[i] = Vector4d(rgba[i * 4 + 0], rgba[i * 4 + 1],
                                 rgba[i * 4 + 2], rgba[i * 4 + 3]);
    }

    stbi_image_free(rgba);

    printf("Loaded image: %s  (%dx%d, %d source channel%s)\n",
           path, width, height, channels, channels == 1 ? "" : "s");
    return true;
}

bool save_image(const char *path, const rgba_image_s &img)
{
    const std::string out = path;
    const size_t np = img.num_pixels();

    if (ends_with(out, ".exr"))
    {
#ifdef HAS_OPENEXR
        return save_exr(path, img);
#else
        fprintf(stderr, "ERROR: built without OpenEXR, cannot write %s\n", path);
        return false;
#endif
    }

    if (ends_with(out, ".hdr"))
    {
        // Radiance HDR: interleaved float RGB
        std::vector<float> hdr_pixels(np * 3);
        for (size_t i = 0; i < np; ++i)
        {
            hdr_pixels[i * 3 + 0] = (float)(img.pixels[i][0] / BK_CHANNEL_MAX);
            hdr_pixels[i * 3 + 1] = (float)(img.pixels[i][1] / BK_CHANNEL_MAX);
            hdr_pixels[i * 3 + 2] = (float)(img.pixels[i][2] / BK_CHANNEL_MAX);
        }
        if (!stbi_write_hdr(path, img.width, img.height, 3, hdr_pixels.data()))
        {
            fprintf(stderr, "ERROR: failed to write HDR: %s\n", path);
            return false;
        }
        printf("Wrote HDR: %s\n", path);
        return true;
    }

    // Convert to 8-bit
    std::vector<unsigned char> pixels(np * BK_CHANNELS);
    for (size_t i = 0; i < np; ++i)
    {
        for (int c = 0; c < BK_CHANNELS; ++c)
            pixels[i * BK_CHANNELS + c] =
                (unsigned char)std::clamp((int)std::lround(img.pixels[i][c]), 0, 255);
    }

    int ok = 0;
    if (ends_with(out, ".png"))
        ok = stbi_write_png(path, img.width, img.height, BK_CHANNELS, pixels.data(),
                            img.width * BK_CHANNELS);
    else if (ends_with(out, ".tga"))
        ok = stbi_write_tga(path, img.width, img.height, BK_CHANNELS, pixels.data());
    else if (ends_with(out, ".bmp"))
        ok = stbi_write_bmp(path, img.width, img.height, BK_CHANNELS, pixels.data());
    else if (ends_with(out, ".jpg") || ends_with(out, ".jpeg"))
        ok = stbi_write_jpg(path, img.width, img.height, BK_CHANNELS, pixels.data(), 95);
    else
    {
        fprintf(stderr, "ERROR: unsupported output format: %s\n", path);
        return false;
    }

    if (!ok)
    {
        fprintf(stderr, "ERROR: failed to write image: %s\n", path);
        return false;
    }
    printf("Wrote image: %s\n", path);
    return true;
}

bool load_mask(const char *path, int width, int height, double threshold,
               std::vector<bool> &mask)
{
    rgba_image_s img;
    if (!load_image(path, img))
        return false;

    if (img.width != width || img.height != height)
    {
        fprintf(stderr, "ERROR: mask %s is %dx%d, image is %dx%d\n",
                path, img.width, img.height, width, height);
        return false;
    }

    mask.assign(img.num_pixels(), false);
    size_t selected = 0;
    for (size_t i = 0; i < img.num_pixels(); ++i)
    {
        const Vector4d &p = img.pixels[i];
        if ((p[0] + p[1] + p[2]) / 3.0 > threshold)
        {
            mask[i] = true;
            ++selected;
        }
    }

    printf("Mask: %zu of %zu pixels selected\n", selected, mask.size());
    return true;
}
