#pragma once

#include <string>
#include <filesystem>

namespace swingrisk {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // 절대 경로는 그대로, 상대 경로는 실행 파일 기준
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // 입력 파일 탐색: 현재 디렉토리 -> 실행 파일 디렉토리 -> 그 상위 디렉토리.
    // 어디에도 없으면 입력 경로를 그대로 반환
    static std::filesystem::path findExistingPath(const std::string& path);
};

} // namespace utils
} // namespace swingrisk
