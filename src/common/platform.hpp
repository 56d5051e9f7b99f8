#pragma once

#define LWGPU_MACOS 1
#define LWGPU_WINDOWS 2
#define LWGPU_EMSCRIPTEN 3
#define LWGPU_LINUX 4

#define LWGPU_UNKNOWN 0xFFFF

#if defined(__EMSCRIPTEN__)
#define LWGPU_PLATFORM LWGPU_EMSCRIPTEN
#elif defined(_WIN32)
#define LWGPU_PLATFORM LWGPU_WINDOWS
#elif defined(__APPLE__)
#define LWGPU_PLATFORM LWGPU_MACOS
#elif defined(__linux__)
#define LWGPU_PLATFORM LWGPU_LINUX
#else
#define LWGPU_PLATFORM LWGPU_UNKNOWN
#endif

static_assert(LWGPU_PLATFORM != LWGPU_UNKNOWN, "Platform detection failed.");
