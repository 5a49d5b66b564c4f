#include "hrx/content_validator.hpp"
#include "hrx/archive.hpp"

#include <algorithm>
#include <functional>
#include <string>

namespace hrx {

namespace {

// Searches for "\n<===>" with one precomputed searcher per validation pass
class BoundaryScanner {
public:
    explicit BoundaryScanner(BoundaryLength width)
        : marker_(makeBoundary(width))
        , pattern_("\n" + marker_)
        , searcher_(pattern_.begin(), pattern_.end()) {}

    BoundaryScanner(const BoundaryScanner&) = delete;
    BoundaryScanner& operator=(const BoundaryScanner&) = delete;

    [[nodiscard]] bool matches(std::string_view text) const {
        if (text.starts_with(marker_)) {
            return true;
        }
        return std::search(text.begin(), text.end(), searcher_) != text.end();
    }

    [[nodiscard]] bool matches(const std::optional<std::string>& text) const {
        return text && matches(std::string_view(*text));
    }

private:
    std::string marker_;
    std::string pattern_;
    std::boyer_moore_horspool_searcher<std::string::const_iterator> searcher_;
};

}  // namespace

bool containsBoundary(std::string_view text, BoundaryLength width) {
    return BoundaryScanner(width).matches(text);
}

std::optional<ContentViolation> findBoundaryViolation(const Archive& archive, BoundaryLength width) {
    BoundaryScanner scanner(width);

    if (scanner.matches(archive.comment())) {
        return ContentViolation{ContentLocation::RootComment, {}};
    }

    for (const auto& [path, entry] : archive.entries()) {
        if (scanner.matches(entry.comment)) {
            return ContentViolation{ContentLocation::EntryComment, path.str()};
        }
        if (const auto* body = entry.body(); body && scanner.matches(std::string_view(*body))) {
            return ContentViolation{ContentLocation::EntryData, path.str()};
        }
    }

    return std::nullopt;
}

}  // namespace hrx
