#pragma once

/**
 * @file entry.hpp
 * @brief Archive entries: files with optional bodies, and directories
 */

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace hrx {

// A file entry. An absent body and an empty body are different values and
// are written differently.
struct File {
    std::optional<std::string> body;

    bool operator==(const File& other) const = default;
};

// A directory entry. Directories never carry a body.
struct Directory {
    bool operator==(const Directory& other) const = default;
};

using EntryData = std::variant<File, Directory>;

// ============================================================================
// Entry - One named file or directory with an optional comment
// ============================================================================

struct Entry {
    std::optional<std::string> comment;  // Metadata only, never structural
    EntryData data = File{};

    Entry() = default;
    explicit Entry(EntryData data_, std::optional<std::string> comment_ = std::nullopt)
        : comment(std::move(comment_)), data(std::move(data_)) {}

    [[nodiscard]] static Entry file(std::optional<std::string> body = std::nullopt) {
        return Entry(File{std::move(body)});
    }
    [[nodiscard]] static Entry directory() { return Entry(Directory{}); }

    [[nodiscard]] bool isFile() const { return std::holds_alternative<File>(data); }
    [[nodiscard]] bool isDirectory() const { return std::holds_alternative<Directory>(data); }

    // Body of a file entry; nullptr for directories and for files without one
    [[nodiscard]] const std::string* body() const {
        if (auto* f = std::get_if<File>(&data); f && f->body) {
            return &*f->body;
        }
        return nullptr;
    }

    bool operator==(const Entry& other) const = default;
};

}  // namespace hrx
