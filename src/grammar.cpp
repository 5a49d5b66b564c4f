#include "hrx/grammar.hpp"
#include "hrx/error.hpp"
#include "hrx/log.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hrx {

namespace {

// One boundary line plus everything up to the next boundary line or end of input
struct Block {
    std::string_view text;  // Starts with the boundary, separating newline excluded
    size_t line;            // 1-based line of the boundary
};

class ArchiveParser {
public:
    ArchiveParser(std::string_view text, BoundaryLength width)
        : text_(text)
        , marker_(makeBoundary(width))
        , archive_(width) {}

    Archive run();

private:
    [[nodiscard]] std::vector<Block> splitBlocks() const;

    void takeComment(const Block& block, std::string_view comment, size_t index);
    void takeEntry(const Block& block, std::string_view header,
                   std::optional<std::string_view> content);
    void insertEntry(size_t line, const Path& path, Entry entry);
    void finish();

    std::string_view text_;
    std::string marker_;
    Archive archive_;

    // Comment block waiting for the entry it belongs to
    std::optional<std::string> pendingComment_;
    size_t pendingLine_ = 0;
    size_t pendingIndex_ = 0;

    // Directory path -> first entry seen below it
    std::unordered_map<std::string, std::string> descendants_;
};

Archive ArchiveParser::run() {
    if (!text_.starts_with(marker_)) {
        throw ParseError(ParseErrorKind::MissingBoundary, 1, "expected '" + marker_ + "'");
    }

    auto blocks = splitBlocks();
    for (size_t i = 0; i < blocks.size(); ++i) {
        const Block& block = blocks[i];
        std::string_view rest = block.text.substr(marker_.size());

        if (rest.empty()) {
            if (i + 1 == blocks.size()) {
                throw ParseError(ParseErrorKind::UnexpectedEndOfInput, block.line,
                                 "boundary without comment text");
            }
            throw ParseError(ParseErrorKind::BareBoundary, block.line, "");
        }
        if (rest.front() == '\n') {
            takeComment(block, rest.substr(1), i);
            continue;
        }
        if (rest.front() != ' ') {
            throw ParseError(ParseErrorKind::MalformedHeader, block.line,
                             "expected ' ' or newline after '" + marker_ + "'");
        }

        rest.remove_prefix(1);
        auto newline = rest.find('\n');
        std::optional<std::string_view> content;
        if (newline != std::string_view::npos) {
            content = rest.substr(newline + 1);
        }
        takeEntry(block, rest.substr(0, newline), content);
    }

    finish();

    auto& log = Log::global();
    if (log.enabled(LogLevel::Debug)) {
        log.debug("parsed " + std::to_string(archive_.entries().size()) + " entries, boundary width " +
                  std::to_string(archive_.boundaryLength().value()));
    }
    return std::move(archive_);
}

std::vector<Block> ArchiveParser::splitBlocks() const {
    std::string separator = "\n" + marker_;

    std::vector<Block> blocks;
    size_t start = 0;
    size_t line = 1;
    while (true) {
        size_t sep = text_.find(separator, start);
        std::string_view blockText = text_.substr(start, sep == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : sep - start);
        blocks.push_back({blockText, line});
        if (sep == std::string_view::npos) {
            break;
        }
        line += static_cast<size_t>(std::count(blockText.begin(), blockText.end(), '\n')) + 1;
        start = sep + 1;
    }
    return blocks;
}

void ArchiveParser::takeComment(const Block& block, std::string_view comment, size_t index) {
    if (pendingComment_) {
        // Only a comment opening the document can be followed by another one
        if (pendingIndex_ != 0) {
            throw ParseError(ParseErrorKind::MisplacedComment, pendingLine_,
                             "followed by another comment");
        }
        archive_.comment() = std::exchange(pendingComment_, std::nullopt);
        archive_.setCommentPlacement(CommentPlacement::Leading);
    }

    pendingComment_ = std::string(comment);
    pendingLine_ = block.line;
    pendingIndex_ = index;
}

void ArchiveParser::takeEntry(const Block& block, std::string_view header,
                              std::optional<std::string_view> content) {
    bool isDirectory = !header.empty() && header.back() == '/';
    Path path = Path::parse(isDirectory ? header.substr(0, header.size() - 1) : header);

    Entry entry;
    if (isDirectory) {
        if (content) {
            throw ParseError(ParseErrorKind::DirectoryWithBody, block.line, "'" + path.str() + "/'");
        }
        entry.data = Directory{};
    } else if (content) {
        entry.data = File{std::string(*content)};
    } else {
        entry.data = File{};
    }

    entry.comment = std::exchange(pendingComment_, std::nullopt);
    insertEntry(block.line, path, std::move(entry));
}

void ArchiveParser::insertEntry(size_t line, const Path& path, Entry entry) {
    auto& entries = archive_.entries();

    if (const Entry* existing = entries.find(path)) {
        throw DuplicateEntryError(line, path.str(), *existing, std::move(entry));
    }

    std::vector<Path> ancestors;
    for (auto parent = path.parent(); parent; parent = parent->parent()) {
        if (const Entry* e = entries.find(*parent); e && e->isFile()) {
            throw FileAsDirectoryError(line, parent->str(), path.str());
        }
        ancestors.push_back(*parent);
    }

    if (entry.isFile()) {
        if (auto it = descendants_.find(path.str()); it != descendants_.end()) {
            throw FileAsDirectoryError(line, path.str(), it->second);
        }
    }

    for (const auto& ancestor : ancestors) {
        descendants_.emplace(ancestor.str(), path.str());
    }
    entries.insert(path, std::move(entry));
}

void ArchiveParser::finish() {
    if (!pendingComment_) {
        return;
    }
    if (archive_.comment()) {
        throw ParseError(ParseErrorKind::ConflictingRootComment, pendingLine_, "");
    }
    archive_.comment() = std::exchange(pendingComment_, std::nullopt);
    archive_.setCommentPlacement(CommentPlacement::Trailing);
}

}  // namespace

Archive parseArchive(std::string_view text, BoundaryLength width) {
    return ArchiveParser(text, width).run();
}

}  // namespace hrx
