#include "hrx/error.hpp"

namespace hrx {

NoBoundaryError::NoBoundaryError()
    : Error("no boundary found in archive text") {}

std::string_view toString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MissingBoundary: return "archive does not begin with a boundary";
        case ParseErrorKind::MalformedHeader: return "malformed boundary line";
        case ParseErrorKind::BareBoundary: return "comment boundary without comment text";
        case ParseErrorKind::DirectoryWithBody: return "directory entry with a body";
        case ParseErrorKind::UnexpectedEndOfInput: return "unexpected end of input";
        case ParseErrorKind::MisplacedComment: return "comment not followed by an entry";
        case ParseErrorKind::ConflictingRootComment: return "more than one archive comment";
        case ParseErrorKind::DuplicateEntry: return "duplicate entry";
        case ParseErrorKind::FileAsDirectory: return "file used as a directory";
    }
    return "parse error";
}

ParseError::ParseError(ParseErrorKind kind, size_t line, const std::string& detail)
    : Error("line " + std::to_string(line) + ": " + std::string(toString(kind)) +
            (detail.empty() ? "" : ": " + detail))
    , kind_(kind)
    , line_(line) {}

DuplicateEntryError::DuplicateEntryError(size_t line, std::string path, Entry existing, Entry incoming)
    : ParseError(ParseErrorKind::DuplicateEntry, line, "'" + path + "'")
    , path_(std::move(path))
    , existing_(std::move(existing))
    , incoming_(std::move(incoming)) {}

FileAsDirectoryError::FileAsDirectoryError(size_t line, std::string parentPath, std::string childPath)
    : ParseError(ParseErrorKind::FileAsDirectory, line,
                 "'" + parentPath + "' is a file but '" + childPath + "' is inside it")
    , parentPath_(std::move(parentPath))
    , childPath_(std::move(childPath)) {}

std::string_view toString(PathErrorKind kind) {
    switch (kind) {
        case PathErrorKind::EmptyComponent: return "empty path component";
        case PathErrorKind::ForbiddenCharacter: return "forbidden character in path component";
        case PathErrorKind::ReservedComponent: return "reserved path component";
    }
    return "invalid path";
}

PathError::PathError(PathErrorKind kind, std::string rawPath, std::string component)
    : Error(std::string(toString(kind)) + " in '" + rawPath + "'")
    , kind_(kind)
    , rawPath_(std::move(rawPath))
    , component_(std::move(component)) {}

std::string_view toString(ContentLocation location) {
    switch (location) {
        case ContentLocation::RootComment: return "archive comment";
        case ContentLocation::EntryComment: return "entry comment";
        case ContentLocation::EntryData: return "file body";
    }
    return "content";
}

namespace {

std::string describe(const ContentViolation& violation) {
    std::string msg = std::string(toString(violation.location)) + " contains the boundary";
    if (!violation.path.empty()) {
        msg += " (" + violation.path + ")";
    }
    return msg;
}

}  // namespace

ContentError::ContentError(ContentViolation violation)
    : Error(describe(violation))
    , violation_(std::move(violation)) {}

}  // namespace hrx
