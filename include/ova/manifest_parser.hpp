#pragma once

#include "crypto/digest.hpp"

#include <map>
#include <string>
#include <string_view>

namespace ovaup {

struct ManifestDigest {
    DigestAlgorithm algorithm = DigestAlgorithm::Sha1;
    std::string hex; // lower-case
};

using ManifestDigests = std::map<std::string, ManifestDigest>;

// Parses checksum manifest text made of lines like
//   SHA1(disk1.vmdk)= 0a1b...
//   SHA256 (package.ovf) = 9f8e...
// Lines that do not match, or name an unknown algorithm, are ignored.
// A later line for the same name replaces an earlier one.
class ChecksumManifestParser {
  public:
    ManifestDigests Parse(std::string_view text) const;

    // Parses one line; returns false if it is not a digest line.
    static bool ParseLine(std::string_view line, std::string& name, ManifestDigest& out);
};

// Case-insensitive hex comparison.
bool HexDigestEquals(std::string_view a, std::string_view b);

} // namespace ovaup
