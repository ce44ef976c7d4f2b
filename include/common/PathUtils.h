#pragma once

#include <string>
#include <filesystem>

namespace instflow {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (cwd when it cannot be determined)
    static std::filesystem::path getExecutableDir();

    // Relative path resolved against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
};

} // namespace utils
} // namespace instflow
