#include "core/state/AtomicJsonFile.h"

#include "common/Logger.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace riskguard {
namespace core {

namespace {
std::atomic<unsigned long> g_tmp_counter{0};

bool fsyncPath(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return false;
    }
    const bool ok = (::fsync(fd) == 0);
    ::close(fd);
    return ok;
}
}

bool writeJsonAtomically(const std::filesystem::path& path, const nlohmann::json& raw) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create state directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    // 여러 프로세스가 같은 레코드를 쓸 수 있으므로 tmp 이름은 pid + 카운터로 구분
    auto tmp_path = path;
    tmp_path += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_tmp_counter.fetch_add(1));

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open temp file {}", tmp_path.string());
            return false;
        }
        out << raw.dump(2);
        out.flush();
        if (!out.good()) {
            LOG_ERROR("Write failed for {}", tmp_path.string());
            out.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }

    if (!fsyncPath(tmp_path)) {
        LOG_WARN("fsync failed for {}", tmp_path.string());
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        LOG_ERROR("Atomic rename {} -> {} failed: {}", tmp_path.string(), path.string(), ec.message());
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}

JsonReadResult readJsonFile(const std::filesystem::path& path) {
    JsonReadResult result;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return result;
    }
    result.exists = true;

    try {
        in >> result.value;
    } catch (const nlohmann::json::exception& e) {
        result.parse_failed = true;
        LOG_WARN("Unreadable record {}: {}", path.string(), e.what());
    }
    return result;
}

FileLockGuard::FileLockGuard(const std::filesystem::path& record_path) {
    auto lock_path = record_path;
    lock_path += ".lock";

    std::error_code ec;
    if (lock_path.has_parent_path()) {
        std::filesystem::create_directories(lock_path.parent_path(), ec);
    }

    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_WARN("Cannot open lock file {}: {}", lock_path.string(), std::strerror(errno));
        return;
    }

    int rc = 0;
    do {
        rc = ::flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        LOG_WARN("flock failed on {}: {}", lock_path.string(), std::strerror(errno));
        ::close(fd);
        return;
    }
    fd_ = fd;
}

FileLockGuard::~FileLockGuard() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace core
} // namespace riskguard
