#include "hrx/boundary.hpp"

#include <stdexcept>

namespace hrx {

BoundaryLength::BoundaryLength(size_t width)
    : width_(width) {
    if (width == 0) {
        throw std::invalid_argument("Boundary length must be positive");
    }
}

std::string makeBoundary(BoundaryLength width) {
    std::string marker;
    marker.reserve(width.value() + 2);
    marker += '<';
    marker.append(width.value(), '=');
    marker += '>';
    return marker;
}

std::optional<BoundaryLength> discoverBoundaryLength(std::string_view text) {
    size_t lineStart = 0;
    while (lineStart < text.size()) {
        if (text[lineStart] == '<') {
            size_t pos = lineStart + 1;
            while (pos < text.size() && text[pos] == '=') {
                pos++;
            }
            size_t width = pos - lineStart - 1;
            if (width > 0 && pos < text.size() && text[pos] == '>') {
                return BoundaryLength(width);
            }
        }

        auto newline = text.find('\n', lineStart);
        if (newline == std::string_view::npos) {
            break;
        }
        lineStart = newline + 1;
    }
    return std::nullopt;
}

}  // namespace hrx
