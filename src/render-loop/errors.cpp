#include "errors.hpp"

#include <fmt/core.h>

namespace lwgpu
{
const char* surfaceErrorKindToStr(const SurfaceErrorKind kind) noexcept
{
    switch (kind)
    {
    case SurfaceErrorKind::Timeout:
        return "Timeout";
    case SurfaceErrorKind::Outdated:
        return "Outdated";
    case SurfaceErrorKind::Lost:
        return "Lost";
    case SurfaceErrorKind::OutOfMemory:
        return "OutOfMemory";
    case SurfaceErrorKind::DeviceLost:
        return "DeviceLost";
    }
    return "Unknown";
}

SurfaceError::SurfaceError(const SurfaceErrorKind kind)
    : std::runtime_error(fmt::format("Surface error: {}", surfaceErrorKindToStr(kind))),
      mKind(kind)
{
}

SurfaceError::SurfaceError(const SurfaceErrorKind kind, const std::string& message)
    : std::runtime_error(
          fmt::format("Surface error: {}. {}", surfaceErrorKindToStr(kind), message)),
      mKind(kind)
{
}
} // namespace lwgpu
