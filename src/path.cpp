#include "hrx/path.hpp"
#include "hrx/error.hpp"

namespace hrx {

namespace {

bool isForbidden(char c) {
    // Multi-byte UTF-8 sequences only use bytes >= 0x80, so a byte check
    // covers every code point up to U+001F.
    return static_cast<unsigned char>(c) <= 0x1F || c == '\\' || c == ':';
}

// Returns the kind and component of the first violation, if any
std::optional<std::pair<PathErrorKind, std::string_view>> findViolation(std::string_view raw) {
    size_t start = 0;
    while (true) {
        size_t slash = raw.find('/', start);
        std::string_view component = raw.substr(start, slash == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : slash - start);
        if (component.empty()) {
            return std::make_pair(PathErrorKind::EmptyComponent, component);
        }
        for (char c : component) {
            if (isForbidden(c)) {
                return std::make_pair(PathErrorKind::ForbiddenCharacter, component);
            }
        }
        if (component == "." || component == "..") {
            return std::make_pair(PathErrorKind::ReservedComponent, component);
        }
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        start = slash + 1;
    }
}

}  // namespace

Path Path::parse(std::string_view raw) {
    if (auto violation = findViolation(raw)) {
        throw PathError(violation->first, std::string(raw), std::string(violation->second));
    }
    return Path(std::string(raw));
}

bool Path::isValid(std::string_view raw) {
    return !findViolation(raw).has_value();
}

std::vector<std::string_view> Path::components() const {
    std::vector<std::string_view> result;
    std::string_view rest = path_;
    size_t slash;
    while ((slash = rest.find('/')) != std::string_view::npos) {
        result.push_back(rest.substr(0, slash));
        rest = rest.substr(slash + 1);
    }
    result.push_back(rest);
    return result;
}

std::optional<Path> Path::parent() const {
    auto slash = path_.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    // Every prefix ending before a '/' is itself valid
    return Path(path_.substr(0, slash));
}

bool Path::isAncestorOf(const Path& other) const {
    return other.path_.size() > path_.size() &&
           other.path_.compare(0, path_.size(), path_) == 0 &&
           other.path_[path_.size()] == '/';
}

}  // namespace hrx
