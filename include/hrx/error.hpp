#pragma once

/**
 * @file error.hpp
 * @brief Exception taxonomy shared by the parser, path validation,
 *        content validation and the serializer
 *
 * Every failure derives from hrx::Error. Callers that only need a message can
 * catch that; callers that want locality catch the specific subclass.
 */

#include "hrx/entry.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hrx {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No boundary marker anywhere in the input
class NoBoundaryError : public Error {
public:
    NoBoundaryError();
};

// ============================================================================
// Grammar and structural errors
// ============================================================================

enum class ParseErrorKind {
    MissingBoundary,         // Text does not begin with the boundary
    MalformedHeader,         // Boundary followed by neither ' ' nor newline
    BareBoundary,            // Path-less boundary line without comment text
    DirectoryWithBody,       // "path/" header followed by a body section
    UnexpectedEndOfInput,    // Input ends right after a bare boundary
    MisplacedComment,        // Two comment blocks in a row outside the root slot
    ConflictingRootComment,  // A second root comment
    DuplicateEntry,
    FileAsDirectory,
};

[[nodiscard]] std::string_view toString(ParseErrorKind kind);

class ParseError : public Error {
public:
    ParseError(ParseErrorKind kind, size_t line, const std::string& detail);

    [[nodiscard]] ParseErrorKind kind() const { return kind_; }

    // 1-based line of the boundary that opened the offending block
    [[nodiscard]] size_t line() const { return line_; }

private:
    ParseErrorKind kind_;
    size_t line_;
};

class DuplicateEntryError : public ParseError {
public:
    DuplicateEntryError(size_t line, std::string path, Entry existing, Entry incoming);

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const Entry& existing() const { return existing_; }
    [[nodiscard]] const Entry& incoming() const { return incoming_; }

private:
    std::string path_;
    Entry existing_;
    Entry incoming_;
};

// A file entry is used as the parent of another entry
class FileAsDirectoryError : public ParseError {
public:
    FileAsDirectoryError(size_t line, std::string parentPath, std::string childPath);

    [[nodiscard]] const std::string& parentPath() const { return parentPath_; }
    [[nodiscard]] const std::string& childPath() const { return childPath_; }

private:
    std::string parentPath_;
    std::string childPath_;
};

// ============================================================================
// Path errors
// ============================================================================

enum class PathErrorKind {
    EmptyComponent,      // Leading, trailing or doubled '/'
    ForbiddenCharacter,  // Control character, '\\' or ':'
    ReservedComponent,   // "." or ".."
};

[[nodiscard]] std::string_view toString(PathErrorKind kind);

class PathError : public Error {
public:
    PathError(PathErrorKind kind, std::string rawPath, std::string component);

    [[nodiscard]] PathErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& rawPath() const { return rawPath_; }
    [[nodiscard]] const std::string& component() const { return component_; }

private:
    PathErrorKind kind_;
    std::string rawPath_;
    std::string component_;
};

// ============================================================================
// Content errors
// ============================================================================

enum class ContentLocation {
    RootComment,
    EntryComment,
    EntryData,
};

[[nodiscard]] std::string_view toString(ContentLocation location);

// First text found to contain the boundary. path is empty for RootComment.
struct ContentViolation {
    ContentLocation location = ContentLocation::RootComment;
    std::string path;

    bool operator==(const ContentViolation& other) const = default;
};

class ContentError : public Error {
public:
    explicit ContentError(ContentViolation violation);

    [[nodiscard]] const ContentViolation& violation() const { return violation_; }

private:
    ContentViolation violation_;
};

// Output stream failure while serializing. The stream may hold a partial
// archive afterwards and should be discarded.
class SinkError : public Error {
public:
    using Error::Error;
};

}  // namespace hrx
