#pragma once

/**
 * @file path.hpp
 * @brief Validated entry paths
 *
 * A path is a '/'-separated list of components. Each component is non-empty,
 * contains only characters above U+001F other than '/', '\\' and ':', and is
 * neither "." nor "..". Path::parse() is the only way to obtain one.
 */

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hrx {

class Path {
public:
    // Validate raw and wrap it. Throws PathError naming the first bad component.
    [[nodiscard]] static Path parse(std::string_view raw);

    // Same checks as parse(), without constructing or throwing
    [[nodiscard]] static bool isValid(std::string_view raw);

    [[nodiscard]] const std::string& str() const { return path_; }
    [[nodiscard]] std::string release() && { return std::move(path_); }

    [[nodiscard]] std::vector<std::string_view> components() const;

    // Path without its last component, or nullopt for a single component
    [[nodiscard]] std::optional<Path> parent() const;

    // True if other lies strictly below this path
    [[nodiscard]] bool isAncestorOf(const Path& other) const;

    auto operator<=>(const Path& other) const = default;

private:
    explicit Path(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

inline std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path.str();
}

}  // namespace hrx

template<>
struct std::hash<hrx::Path> {
    size_t operator()(const hrx::Path& p) const noexcept {
        return std::hash<std::string>{}(p.str());
    }
};
