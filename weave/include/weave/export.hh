// weave

#pragma once

#if defined(WV_EXPORT)
#if defined(_WINDOWS)
#define WV_API __declspec(dllexport)
#else
#define WV_API [[gnu::visibility("default")]]
#endif
#else
#define WV_API
#endif

#if defined(WV_EXTRA_EXPORT)
#if defined(_WINDOWS)
#define WV_EXTRA_API __declspec(dllexport)
#else
#define WV_EXTRA_API [[gnu::visibility("default")]]
#endif
#else
#define WV_EXTRA_API
#endif
