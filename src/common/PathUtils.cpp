#include "common/PathUtils.h"

#include <system_error>

namespace riskguard {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    // 모니터/패닉 서버/소비자가 같은 state/ 파일을 봐야 하므로 작업 디렉토리 기준
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return getExecutableDir() / relative_path;
    }
    return cwd / relative_path;
}

std::filesystem::path PathUtils::getConfigDir() {
    const auto from_cwd = resolveRelativePath("config");
    if (std::filesystem::exists(from_cwd)) {
        return from_cwd;
    }
    return getExecutableDir() / "config";
}

std::filesystem::path PathUtils::getStateDir() {
    return resolveRelativePath("state");
}

} // namespace utils
} // namespace riskguard
