#include "hrx/serializer.hpp"
#include "hrx/content_validator.hpp"
#include "hrx/error.hpp"
#include "hrx/log.hpp"

#include <ios>
#include <string>

namespace hrx {

namespace {

class ArchiveWriter {
public:
    ArchiveWriter(std::ostream& out, BoundaryLength width)
        : out_(out)
        , marker_(makeBoundary(width)) {}

    void comment(const std::string& text) {
        boundary();
        out_ << '\n' << text;
        check();
    }

    void entry(const Path& path, const Entry& entry) {
        if (entry.comment) {
            comment(*entry.comment);
        }

        boundary();
        out_ << ' ' << path.str();
        if (entry.isDirectory()) {
            out_ << '/';
        } else if (const auto* body = entry.body()) {
            out_ << '\n' << *body;
        }
        check();
    }

    void check() {
        if (!out_) {
            throw SinkError("failed to write archive to output stream");
        }
    }

private:
    // Every boundary line after the first is preceded by the newline that
    // ends the previous block
    void boundary() {
        if (started_) {
            out_ << '\n';
        }
        out_ << marker_;
        started_ = true;
    }

    std::ostream& out_;
    std::string marker_;
    bool started_ = false;
};

// A leading comment reads back as the first entry's comment unless that entry
// has a comment of its own
bool writeCommentFirst(const Archive& archive) {
    if (archive.commentPlacement() != CommentPlacement::Leading) {
        return false;
    }
    const auto& entries = archive.entries();
    return entries.empty() || entries.front().second.comment.has_value();
}

}  // namespace

void writeArchive(const Archive& archive, std::ostream& out) {
    if (auto violation = findBoundaryViolation(archive, archive.boundaryLength())) {
        throw ContentError(std::move(*violation));
    }

    ArchiveWriter writer(out, archive.boundaryLength());
    try {
        writer.check();

        const auto& comment = archive.comment();
        bool commentFirst = writeCommentFirst(archive);
        if (comment && commentFirst) {
            writer.comment(*comment);
        }
        for (const auto& [path, entry] : archive.entries()) {
            writer.entry(path, entry);
        }
        if (comment && !commentFirst) {
            writer.comment(*comment);
        }
        out.flush();
        writer.check();
    } catch (const std::ios_base::failure& e) {
        // Streams with exceptions() enabled report failures this way
        throw SinkError(std::string("failed to write archive: ") + e.what());
    }

    auto& log = Log::global();
    if (log.enabled(LogLevel::Debug)) {
        log.debug("wrote " + std::to_string(archive.entries().size()) + " entries, boundary width " +
                  std::to_string(archive.boundaryLength().value()));
    }
}

}  // namespace hrx
