#include "common/PathUtils.h"

#include <system_error>

namespace swingrisk {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path path(relative_path);
    if (path.is_absolute()) {
        return path;
    }
    return getExecutableDir() / path;
}

std::filesystem::path PathUtils::findExistingPath(const std::string& path) {
    const std::filesystem::path requested(path);
    std::error_code ec;
    if (requested.is_absolute() || std::filesystem::exists(requested, ec)) {
        return requested;
    }

    const auto exe_dir = getExecutableDir();
    for (const auto& base : {exe_dir, exe_dir.parent_path()}) {
        const auto candidate = base / requested;
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
    return requested;
}

} // namespace utils
} // namespace swingrisk
