#pragma once

#include "gpu_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace lwgpu
{
// Reads a WGSL file into shader sources labelled with the file name. Throws
// std::runtime_error if the file cannot be read.
ShaderSources loadShaderSource(
    const std::filesystem::path& path,
    std::string                  vertexEntryPoint = "vs_main",
    std::string                  fragmentEntryPoint = "fs_main");

// Polls a file's last write time.
class ShaderFileWatcher
{
public:
    explicit ShaderFileWatcher(std::filesystem::path path);

    // Returns true once for each observed change in the file's last write time, including the
    // file appearing. A missing file is never reported as changed.
    bool poll();

    inline const std::filesystem::path& path() const noexcept { return mPath; }

private:
    std::optional<std::filesystem::file_time_type> lastWriteTime() const;

    std::filesystem::path                          mPath;
    std::optional<std::filesystem::file_time_type> mLastWriteTime;
};
} // namespace lwgpu
