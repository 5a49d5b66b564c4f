#pragma once

/**
 * @file grammar.hpp
 * @brief Archive text grammar
 *
 * Format (W = boundary width, fixed for the whole document):
 * ```
 * <===> path/to/file.txt      file header; the body follows on the next line
 * file contents
 * <===>                       comment block; comment text follows
 * describes the next entry
 * <===> some/directory/       directory header; no body allowed
 * ```
 *
 * Every block is terminated by the newline in front of the next boundary line,
 * or by the end of the input. Text between a header's newline and that
 * terminator is the body (or comment) verbatim, so a file header with no
 * newline after it has no body, while "<===> f\n" followed by the next
 * boundary line or the end of input has an empty body.
 *
 * Comment blocks attach to the entry that follows. A comment block that ends
 * the document is the archive comment; so is the very first block when it is
 * followed by another comment block.
 */

#include "hrx/archive.hpp"
#include "hrx/boundary.hpp"

#include <string_view>

namespace hrx {

// Parse text using a known boundary width.
// Throws ParseError (and subclasses) or PathError; nothing is returned on failure.
[[nodiscard]] Archive parseArchive(std::string_view text, BoundaryLength width);

}  // namespace hrx
