#ifndef _BK_MASK_H
#define _BK_MASK_H

#include <cstddef>
#include <vector>

#include "types.h"

// out[p] = mask[p] ? convolved[p] : original[p]
//
// `original` and `out` may alias.  A mask whose length differs from `count`
// is BK_ERR_DIMENSION and nothing is written.
bk_status_e composite_masked(const Vector4d *original, const Vector4d *convolved,
                             const std::vector<bool> &mask, size_t count,
                             Vector4d *out);

#endif
