#include "shader_source.hpp"

#include <fmt/core.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace lwgpu
{
ShaderSources loadShaderSource(
    const fs::path& path,
    std::string     vertexEntryPoint,
    std::string     fragmentEntryPoint)
{
    std::ifstream file(path);
    if (!file)
    {
        throw std::runtime_error(fmt::format("Failed to open shader file {}.", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return ShaderSources{
        .label = path.filename().string(),
        .wgsl = buffer.str(),
        .vertexEntryPoint = std::move(vertexEntryPoint),
        .fragmentEntryPoint = std::move(fragmentEntryPoint),
    };
}

ShaderFileWatcher::ShaderFileWatcher(fs::path path)
    : mPath(std::move(path)),
      mLastWriteTime()
{
    mLastWriteTime = lastWriteTime();
}

bool ShaderFileWatcher::poll()
{
    const auto current = lastWriteTime();
    if (!current)
    {
        return false;
    }

    const bool changed = mLastWriteTime.has_value() && *current != *mLastWriteTime;
    const bool appeared = !mLastWriteTime.has_value();
    mLastWriteTime = current;

    return changed || appeared;
}

std::optional<fs::file_time_type> ShaderFileWatcher::lastWriteTime() const
{
    std::error_code          ec;
    const fs::file_time_type time = fs::last_write_time(mPath, ec);
    if (ec)
    {
        return std::nullopt;
    }
    return time;
}
} // namespace lwgpu
