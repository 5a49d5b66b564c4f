#include "hrx/settings.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace hrx {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

void warnValue(std::string_view key, std::string_view value) {
    Log::global().warn("settings: invalid value '" + std::string(value) + "' for " + std::string(key));
}

void applyLine(std::string_view key, std::string_view value, Settings& settings) {
    if (key == "log.level") {
        if (auto level = parseLogLevel(value)) {
            settings.logLevel = *level;
        } else {
            warnValue(key, value);
        }
    } else if (key == "archive.boundary_length") {
        size_t width = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), width);
        if (ec == std::errc() && end == value.data() + value.size() && width > 0) {
            settings.boundaryLength = BoundaryLength(width);
        } else {
            warnValue(key, value);
        }
    } else if (key == "archive.root_comment") {
        if (value == "leading") {
            settings.commentPlacement = CommentPlacement::Leading;
        } else if (value == "trailing") {
            settings.commentPlacement = CommentPlacement::Trailing;
        } else {
            warnValue(key, value);
        }
    } else {
        Log::global().warn("settings: unknown key '" + std::string(key) + "'");
    }
}

}  // namespace

Settings parseSettings(std::string_view content) {
    Settings settings;
    std::string_view remaining = content;

    while (!remaining.empty()) {
        // Find end of line
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }

        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            Log::global().warn("settings: ignoring line without ':': " + std::string(line));
            continue;
        }
        applyLine(trim(line.substr(0, colon)), trim(line.substr(colon + 1)), settings);
    }

    return settings;
}

std::optional<Settings> loadSettings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseSettings(buffer.str());
}

void applySettings(const Settings& settings) {
    Log::global().setLevel(settings.logLevel);
}

Archive makeArchive(const Settings& settings) {
    Archive archive(settings.boundaryLength);
    archive.setCommentPlacement(settings.commentPlacement);
    return archive;
}

}  // namespace hrx
