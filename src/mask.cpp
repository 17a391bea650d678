#include "mask.h"

#include <cstdio>

bk_status_e composite_masked(const Vector4d *original, const Vector4d *convolved,
                             const std::vector<bool> &mask, size_t count,
                             Vector4d *out)
{
    if (mask.size() != count)
    {
        fprintf(stderr, "ERROR: mask has %zu entries, image has %zu pixels\n",
                mask.size(), count);
        return BK_ERR_DIMENSION;
    }

    for (size_t i = 0; i < count; ++i)
        out[i] = mask[i] ? convolved[i] : original[i];
    return BK_OK;
}
