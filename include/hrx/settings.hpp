#pragma once

/**
 * @file settings.hpp
 * @brief Library settings in "key: value" text form
 *
 * Format:
 * ```
 * # Comments start with #
 * log.level: debug
 * archive.boundary_length: 5
 * archive.root_comment: trailing
 * ```
 *
 * Unknown keys and unparseable values are reported as warnings and ignored,
 * leaving the default in place.
 */

#include "hrx/archive.hpp"
#include "hrx/boundary.hpp"
#include "hrx/log.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace hrx {

struct Settings {
    LogLevel logLevel = LogLevel::Warning;
    BoundaryLength boundaryLength{3};                     // For new archives
    CommentPlacement commentPlacement = CommentPlacement::Leading;
};

[[nodiscard]] Settings parseSettings(std::string_view content);

// Returns nullopt if the file can't be read
[[nodiscard]] std::optional<Settings> loadSettings(const std::filesystem::path& path);

// Configure the global logger
void applySettings(const Settings& settings);

// Empty archive with the configured boundary length and comment placement
[[nodiscard]] Archive makeArchive(const Settings& settings);

}  // namespace hrx
