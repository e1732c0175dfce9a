#pragma once

#include <string>
#include <filesystem>

namespace riskguard {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // 상대 경로를 절대 경로로 변환 (작업 디렉토리 우선, 없으면 실행 파일 기준)
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
    static std::filesystem::path getStateDir();
};

} // namespace utils
} // namespace riskguard
