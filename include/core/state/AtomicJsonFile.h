#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace riskguard {
namespace core {

// tmp 파일에 쓰고 fsync 후 rename 으로 교체. reader 는 이전/새 레코드 중 하나만 본다.
bool writeJsonAtomically(const std::filesystem::path& path, const nlohmann::json& raw);

struct JsonReadResult {
    bool exists = false;
    bool parse_failed = false;
    nlohmann::json value;
};

JsonReadResult readJsonFile(const std::filesystem::path& path);

// <path>.lock 에 대한 flock(LOCK_EX). 다른 프로세스의 읽기-검사-쓰기 구간과 직렬화한다.
// rename 이 레코드 inode 를 바꾸므로 레코드가 아닌 별도 파일을 잠근다.
class FileLockGuard {
public:
    explicit FileLockGuard(const std::filesystem::path& record_path);
    ~FileLockGuard();

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    bool locked() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

} // namespace core
} // namespace riskguard
