#pragma once

#include "crypto/digest.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ovaup {

enum class EntryKind {
    Descriptor, // .ovf
    Payload,    // .vmdk
    Manifest,   // .mf
    Signature,  // .cert
    Other,
};

EntryKind ClassifyEntryName(const std::string& name);

// One regular file inside the container. `offset` is the absolute position
// of the first data byte within the container file.
struct ArchiveEntry {
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t offset = 0;
    std::string checksum; // lower-case hex, empty when the manifest has none
    std::optional<DigestAlgorithm> checksum_algorithm;
};

struct ArchivePackage {
    std::string path;
    std::uint64_t file_size = 0;
    ArchiveEntry descriptor;
    std::vector<ArchiveEntry> payloads; // archive order
    std::optional<ArchiveEntry> manifest;
    std::optional<ArchiveEntry> signature;

    std::uint64_t TotalPayloadSize() const;
    std::vector<std::string> ListEntries() const;
};

} // namespace ovaup
