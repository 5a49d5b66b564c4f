#pragma once

/**
 * @file archive.hpp
 * @brief In-memory human-readable archive
 *
 * An archive is an optional comment plus an insertion-ordered set of entries,
 * all separated by one boundary marker. No comment or body may contain a
 * newline followed by that marker, but since callers can edit text freely
 * this is only checked on demand:
 *
 *   1. when the archive is parsed,
 *   2. when the boundary length changes (setBoundaryLength()),
 *   3. when the archive is serialized.
 *
 * Usage:
 * ```cpp
 * auto archive = hrx::Archive::parse(text);
 * archive.entries().insert(hrx::Path::parse("notes.txt"), hrx::Entry::file("hi"));
 * archive.serialize(std::cout);
 * ```
 */

#include "hrx/boundary.hpp"
#include "hrx/entry.hpp"
#include "hrx/ordered_map.hpp"
#include "hrx/path.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace hrx {

// Where the archive comment sits in the text
enum class CommentPlacement {
    Leading,   // Before the first entry
    Trailing,  // After the last entry
};

using EntryMap = OrderedMap<Path, Entry>;

class Archive {
public:
    explicit Archive(BoundaryLength boundaryLength);

    // Parse archive text, discovering the boundary from the first marker.
    // Throws NoBoundaryError, ParseError (and subclasses) or PathError.
    [[nodiscard]] static Archive parse(std::string_view text);

    // ========================================================================
    // Content
    // ========================================================================

    [[nodiscard]] std::optional<std::string>& comment() { return comment_; }
    [[nodiscard]] const std::optional<std::string>& comment() const { return comment_; }

    // Entries in archive order. Uniqueness of keys is kept by the map, but
    // the file-as-parent rule is only checked while parsing.
    [[nodiscard]] EntryMap& entries() { return entries_; }
    [[nodiscard]] const EntryMap& entries() const { return entries_; }

    [[nodiscard]] CommentPlacement commentPlacement() const { return placement_; }
    void setCommentPlacement(CommentPlacement placement) { placement_ = placement; }

    // ========================================================================
    // Boundary
    // ========================================================================

    [[nodiscard]] BoundaryLength boundaryLength() const { return boundaryLength_; }

    // Switch to a new boundary length. Throws ContentError naming the first
    // text containing the new boundary; the archive is unchanged in that case.
    void setBoundaryLength(BoundaryLength length);

    // Throws ContentError if any text contains the current boundary
    void validateContent() const;

    // ========================================================================
    // Output
    // ========================================================================

    // Write the archive text. Throws ContentError before writing anything,
    // or SinkError if the stream fails part way.
    //
    // parse() reads the output back to an equal archive, except for an
    // archive with no comment and no entries: it writes nothing, and empty
    // text has no boundary to discover (NoBoundaryError).
    void serialize(std::ostream& out) const;

    [[nodiscard]] std::string toString() const;

    // Compares comment, entries (in order) and boundary length.
    // Comment placement is layout only and not compared.
    bool operator==(const Archive& other) const;

private:
    std::optional<std::string> comment_;
    EntryMap entries_;
    BoundaryLength boundaryLength_;
    CommentPlacement placement_ = CommentPlacement::Leading;
};

}  // namespace hrx
