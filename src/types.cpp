#include "types.h"

const char *bk_status_string(bk_status_e status)
{
    switch (status)
    {
    case BK_OK:
        return "ok";
    case BK_ERR_CONFIG:
        return "configuration error";
    case BK_ERR_DIMENSION:
        return "dimension error";
    case BK_ERR_NUMERIC:
        return "numeric degeneracy";
    }
    return "unknown status";
}
