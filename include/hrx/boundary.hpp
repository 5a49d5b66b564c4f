#pragma once

/**
 * @file boundary.hpp
 * @brief Boundary markers: "<" + width '=' characters + ">"
 *
 * The width is fixed for a whole archive. When reading, it is taken from the
 * first marker that starts a line.
 */

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hrx {

// Boundary width, always at least one
class BoundaryLength {
public:
    // Throws std::invalid_argument for zero
    explicit BoundaryLength(size_t width);

    [[nodiscard]] size_t value() const { return width_; }

    auto operator<=>(const BoundaryLength& other) const = default;

private:
    size_t width_;
};

// The marker itself, e.g. "<===>" for width 3
[[nodiscard]] std::string makeBoundary(BoundaryLength width);

// Width of the first "<=...=>" found at the start of text or right after a
// newline, or nullopt when there is none
[[nodiscard]] std::optional<BoundaryLength> discoverBoundaryLength(std::string_view text);

}  // namespace hrx
