#include "ova/archive_package.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace ovaup {

EntryKind ClassifyEntryName(const std::string& name) {
    std::string ext = std::filesystem::path(name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (ext == ".ovf") return EntryKind::Descriptor;
    if (ext == ".vmdk") return EntryKind::Payload;
    if (ext == ".mf") return EntryKind::Manifest;
    if (ext == ".cert") return EntryKind::Signature;
    return EntryKind::Other;
}

std::uint64_t ArchivePackage::TotalPayloadSize() const {
    std::uint64_t total = 0;
    for (const auto& p : payloads) total += p.size;
    return total;
}

std::vector<std::string> ArchivePackage::ListEntries() const {
    std::vector<std::string> out;
    out.push_back(descriptor.name);
    for (const auto& p : payloads) out.push_back(p.name);
    if (manifest) out.push_back(manifest->name);
    if (signature) out.push_back(signature->name);
    return out;
}

} // namespace ovaup
