#pragma once

#include <stdexcept>
#include <string>

namespace lwgpu
{
// No GPU instance, surface, compatible adapter or device could be created.
class InitializationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A shader module or render pipeline failed to build.
class CompilationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class SurfaceErrorKind
{
    Timeout,
    Outdated,
    Lost,
    OutOfMemory,
    DeviceLost,
};

const char* surfaceErrorKindToStr(SurfaceErrorKind kind) noexcept;

// Outdated and Lost can be recovered from by reconfiguring the surface, Timeout by trying
// again on the next frame.
constexpr bool isRecoverable(const SurfaceErrorKind kind) noexcept
{
    return kind == SurfaceErrorKind::Outdated || kind == SurfaceErrorKind::Lost;
}

class SurfaceError : public std::runtime_error
{
public:
    explicit SurfaceError(SurfaceErrorKind kind);
    SurfaceError(SurfaceErrorKind kind, const std::string& message);

    SurfaceErrorKind kind() const noexcept { return mKind; }

private:
    SurfaceErrorKind mKind;
};
} // namespace lwgpu
