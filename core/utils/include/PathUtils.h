#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace WatchBridge {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDefaultConfigPath();

    /**
     * @brief Express @p path relative to @p base as a '/'-joined string
     *
     * Returns "" when the two are equal and std::nullopt when @p path does not
     * lie under @p base. Both arguments must already be lexically normal.
     */
    static std::optional<std::string> relativeTo(const std::filesystem::path& base,
                                                 const std::filesystem::path& path);

    /// Join a relative directory ("" = root) with an entry name
    static std::string joinRelative(const std::string& dir, const std::string& name);

    /// True when @p path equals @p ancestor or lies below it ("" contains everything)
    static bool isSameOrBelow(const std::string& path, const std::string& ancestor);

    /// Strict ancestors of a relative path, nearest first ("a/b/c" -> "a/b", "a", "")
    static std::vector<std::string> ancestorsOf(const std::string& path);
};

} // namespace WatchBridge
