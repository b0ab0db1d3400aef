#include "common/PathUtils.h"

namespace autocoin {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    std::filesystem::path rel(relative_path);
    if (rel.is_absolute()) {
        return rel;
    }

    std::error_code ec;
    auto cwd_candidate = std::filesystem::current_path(ec) / rel;
    if (!ec && std::filesystem::exists(cwd_candidate)) {
        return cwd_candidate;
    }

    auto exe_candidate = getExecutableDir() / rel;
    if (std::filesystem::exists(exe_candidate)) {
        return exe_candidate;
    }

    // 아직 없는 경로(로그/데이터 디렉토리)는 현재 디렉토리 기준으로 생성
    return ec ? exe_candidate : cwd_candidate;
}

} // namespace utils
} // namespace autocoin
