#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace interview_coach {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

bool ensure_directory(const std::string& path) {
    if (path.empty()) return true;
    std::error_code ec;
    std::filesystem::path dir(expand_path(path));
    if (std::filesystem::exists(dir, ec)) {
        return std::filesystem::is_directory(dir, ec);
    }
    std::filesystem::create_directories(dir, ec);
    return !ec;
}

std::string session_log_filename(const std::string& scenario, const std::string& session_id) {
    const std::string& suffix = scenario.empty() ? session_id : scenario;
    return "interview_log_" + suffix + ".json";
}

} // namespace interview_coach
