#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace ovaup {

// Feeds libarchive from an IReader. Uses IReader::Skip() for entry data the
// caller never reads. Returns the archive_read_open2() status.
int OpenArchiveFromReader(struct archive* ar, IReader& reader);

std::string ArchiveErr(struct archive* ar);

} // namespace ovaup
