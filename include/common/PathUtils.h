#pragma once

#include <string>
#include <filesystem>

namespace capflow {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory).
    static std::filesystem::path getExecutableDir();

    // Relative paths are resolved against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Journal, strategy store and log locations from config. An empty path
    // means "disabled" and is returned as is; absolute paths are kept.
    static std::string resolveStatePath(const std::string& path);
};

} // namespace utils
} // namespace capflow
