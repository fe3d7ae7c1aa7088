#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace WatchBridge {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "watchbridge";
    }
    return getHome() / ".config" / "watchbridge";
}

std::filesystem::path PathUtils::getDefaultConfigPath() {
    return getConfigDir() / "watchbridge.conf";
}

std::optional<std::string> PathUtils::relativeTo(const std::filesystem::path& base,
                                                 const std::filesystem::path& path) {
    auto baseIt = base.begin();
    auto pathIt = path.begin();
    for (; baseIt != base.end(); ++baseIt) {
        // A trailing separator shows up as an empty final element
        if (baseIt->empty()) {
            continue;
        }
        if (pathIt == path.end() || *pathIt != *baseIt) {
            return std::nullopt;
        }
        ++pathIt;
    }

    std::string relative;
    for (; pathIt != path.end(); ++pathIt) {
        if (pathIt->empty()) {
            continue;
        }
        relative = joinRelative(relative, pathIt->string());
    }
    return relative;
}

std::string PathUtils::joinRelative(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (name.empty()) {
        return dir;
    }
    return dir + "/" + name;
}

bool PathUtils::isSameOrBelow(const std::string& path, const std::string& ancestor) {
    if (ancestor.empty() || path == ancestor) {
        return true;
    }
    return path.size() > ancestor.size() &&
           path.compare(0, ancestor.size(), ancestor) == 0 &&
           path[ancestor.size()] == '/';
}

std::vector<std::string> PathUtils::ancestorsOf(const std::string& path) {
    std::vector<std::string> ancestors;
    if (path.empty()) {
        return ancestors;
    }
    std::string current = path;
    for (;;) {
        auto slash = current.rfind('/');
        if (slash == std::string::npos) {
            ancestors.push_back("");
            break;
        }
        current = current.substr(0, slash);
        ancestors.push_back(current);
    }
    return ancestors;
}

} // namespace WatchBridge
