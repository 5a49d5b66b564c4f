#pragma once

/**
 * @file serializer.hpp
 * @brief Archive text output
 *
 * Output is the exact inverse of parseArchive(): text parsed from a document
 * is written back byte for byte as long as the boundary length is unchanged.
 */

#include "hrx/archive.hpp"

#include <ostream>

namespace hrx {

// Validate content against the archive's boundary, then write it to out.
// Throws ContentError before writing anything if some text contains the
// boundary. Throws SinkError if the stream fails; out then holds a partial
// archive that must be discarded.
void writeArchive(const Archive& archive, std::ostream& out);

}  // namespace hrx
