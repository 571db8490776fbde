#pragma once

#include "io/range_reader.hpp"
#include "ova/archive_package.hpp"
#include "util/result.hpp"

#include <string>

namespace ovaup {

// Builds an ArchivePackage from a TAR container in one sequential pass.
//
// Failures:
//   ErrorCode::Io                    container cannot be opened or read
//   ErrorCode::Parse                 not a TAR stream, truncated, duplicate
//                                    names, more than one descriptor
//   ErrorCode::MissingRequiredEntry  no descriptor or no payload entry
class ArchiveIndexer {
  public:
    ArchiveIndexer() = default;
    explicit ArchiveIndexer(const IRangeSource& source) : source_(&source) {}

    Result Index(const std::string& path, ArchivePackage& out) const;

  private:
    Result AttachManifestDigests(ArchivePackage& pkg) const;

    const IRangeSource* source_ = nullptr;
};

// Re-reads entry.size bytes at entry.offset and compares the digest with
// entry.checksum. An entry without a checksum always validates.
Result ValidateChecksum(const std::string& path, const ArchiveEntry& entry);
Result ValidateChecksum(const IRangeSource& source,
                        const std::string& path,
                        const ArchiveEntry& entry);

} // namespace ovaup
