// weave

#pragma once

#if !defined(WV_ASSERT)
#include <cassert>
#define WV_ASSERT(x, ...) assert(x)
#endif

#if _MSC_VER
#define WV_BREAK() __debugbreak()
#else
#define WV_BREAK() (void)0
#endif

#if !defined(WV_VERIFY)
#define WV_VERIFY(x, ...) !!((x) || (WV_BREAK(), false))
#endif

#define WV_GUARD_OR(x, r, ...) \
    if (WV_VERIFY(x))          \
    {                          \
    }                          \
    else                       \
    {                          \
        WV_BREAK();            \
        return (r);            \
    }

#define WV_GUARD_VOID(x, ...) \
    if (WV_VERIFY(x))         \
    {                         \
    }                         \
    else                      \
    {                         \
        WV_BREAK();           \
        return;               \
    }
