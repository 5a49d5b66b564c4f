#pragma once

/**
 * @file content_validator.hpp
 * @brief Boundary safety check for comments and bodies
 *
 * Text is unsafe for a given width when it contains a newline followed by the
 * marker, or begins with the marker (it is always written right after a
 * header line's newline).
 */

#include "hrx/boundary.hpp"
#include "hrx/error.hpp"

#include <optional>
#include <string_view>

namespace hrx {

class Archive;

// True if text would read back as containing a boundary line of this width
[[nodiscard]] bool containsBoundary(std::string_view text, BoundaryLength width);

// First unsafe text in archive order: the archive comment, then for each entry
// its comment followed by its body. Does not modify the archive.
[[nodiscard]] std::optional<ContentViolation> findBoundaryViolation(const Archive& archive,
                                                                    BoundaryLength width);

}  // namespace hrx
