#include "hrx/archive.hpp"
#include "hrx/content_validator.hpp"
#include "hrx/error.hpp"
#include "hrx/grammar.hpp"
#include "hrx/log.hpp"
#include "hrx/serializer.hpp"

#include <sstream>

namespace hrx {

Archive::Archive(BoundaryLength boundaryLength)
    : boundaryLength_(boundaryLength) {}

Archive Archive::parse(std::string_view text) {
    auto width = discoverBoundaryLength(text);
    if (!width) {
        throw NoBoundaryError();
    }

    auto& log = Log::global();
    if (log.enabled(LogLevel::Debug)) {
        log.debug("discovered boundary width " + std::to_string(width->value()));
    }
    return parseArchive(text, *width);
}

void Archive::setBoundaryLength(BoundaryLength length) {
    if (auto violation = findBoundaryViolation(*this, length)) {
        auto& log = Log::global();
        if (log.enabled(LogLevel::Debug)) {
            log.debug("boundary length " + std::to_string(length.value()) + " rejected: " +
                      std::string(hrx::toString(violation->location)) +
                      (violation->path.empty() ? "" : " " + violation->path));
        }
        throw ContentError(std::move(*violation));
    }
    boundaryLength_ = length;
}

void Archive::validateContent() const {
    if (auto violation = findBoundaryViolation(*this, boundaryLength_)) {
        throw ContentError(std::move(*violation));
    }
}

void Archive::serialize(std::ostream& out) const {
    writeArchive(*this, out);
}

std::string Archive::toString() const {
    std::ostringstream out;
    writeArchive(*this, out);
    return out.str();
}

bool Archive::operator==(const Archive& other) const {
    return comment_ == other.comment_ &&
           entries_ == other.entries_ &&
           boundaryLength_ == other.boundaryLength_;
}

}  // namespace hrx
