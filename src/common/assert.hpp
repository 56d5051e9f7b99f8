#pragma once

#include <cassert>

#define LWGPU_ASSERT(condition)                                                                    \
    do                                                                                             \
    {                                                                                              \
        if (!(condition)) [[unlikely]]                                                             \
        {                                                                                          \
            assert(condition);                                                                     \
        }                                                                                          \
    } while (false)
