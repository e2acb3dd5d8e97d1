#pragma once

#include <string>
#include <filesystem>

namespace stratlab {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the working directory first, then the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace stratlab
