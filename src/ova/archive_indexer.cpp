#include "ova/archive_indexer.hpp"

#include "io/file_reader.hpp"
#include "ova/manifest_parser.hpp"
#include "ova/tar_reader_adapter.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <set>

namespace ovaup {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

const IRangeSource& DefaultSource() {
    static const FileRangeSource source;
    return source;
}

} // namespace

Result ArchiveIndexer::Index(const std::string& path, ArchivePackage& out) const {
    FileReader file;
    auto open_res = FileReader::Open(path, file);
    if (!open_res.ok) return open_res;

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorCode::Io, "archive_read_new failed");

    // Plain TAR only: payload offsets must address the container file itself.
    archive_read_support_filter_none(ar.get());
    archive_read_support_format_tar(ar.get());

    if (OpenArchiveFromReader(ar.get(), file) != ARCHIVE_OK) {
        return Result::Fail(ErrorCode::Parse, "archive_read_open2: " + ArchiveErr(ar.get()));
    }

    ArchivePackage pkg;
    pkg.path = path;
    pkg.file_size = file.TotalSize().value_or(0);

    bool have_descriptor = false;
    std::set<std::string> seen;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("archive warning in %s: %s", path.c_str(), ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(ErrorCode::Parse,
                                "failed to read tar archive " + path + ": " + ArchiveErr(ar.get()));
        }

        // Consumed bytes of the format-facing filter: every header block of
        // this record has been read, so this is the first data byte.
        const la_int64_t data_offset = archive_filter_bytes(ar.get(), 0);
        const la_int64_t size = archive_entry_size(entry);
        if (data_offset < 0 || size < 0) {
            return Result::Fail(ErrorCode::Parse, "invalid record position in " + path);
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }

        ArchiveEntry info;
        const char* name = archive_entry_pathname(entry);
        info.name = name ? std::string(name) : std::string();
        info.size = static_cast<std::uint64_t>(size);
        info.offset = static_cast<std::uint64_t>(data_offset);

        if (pkg.file_size > 0 && info.offset + info.size > pkg.file_size) {
            return Result::Fail(ErrorCode::Parse,
                                "entry " + info.name + " extends past end of " + path);
        }
        if (!seen.insert(info.name).second) {
            return Result::Fail(ErrorCode::Parse, "duplicate entry in archive: " + info.name);
        }

        LogDebug("entry %s size=%llu offset=%llu",
                 info.name.c_str(),
                 (unsigned long long)info.size,
                 (unsigned long long)info.offset);

        switch (ClassifyEntryName(info.name)) {
            case EntryKind::Descriptor:
                if (have_descriptor) {
                    return Result::Fail(ErrorCode::Parse,
                                        "more than one descriptor in archive: " +
                                            pkg.descriptor.name + ", " + info.name);
                }
                pkg.descriptor = std::move(info);
                have_descriptor = true;
                break;
            case EntryKind::Payload:
                pkg.payloads.push_back(std::move(info));
                break;
            case EntryKind::Manifest:
                pkg.manifest = std::move(info);
                break;
            case EntryKind::Signature:
                pkg.signature = std::move(info);
                break;
            case EntryKind::Other:
                break;
        }
    }

    if (!have_descriptor) {
        return Result::Fail(ErrorCode::MissingRequiredEntry,
                            "no OVF descriptor found in package " + path);
    }
    if (pkg.payloads.empty()) {
        return Result::Fail(ErrorCode::MissingRequiredEntry,
                            "no VMDK payload found in package " + path);
    }

    if (pkg.manifest) {
        auto mf_res = AttachManifestDigests(pkg);
        if (!mf_res.ok) return mf_res;
    }

    out = std::move(pkg);
    return Result::Ok();
}

Result ArchiveIndexer::AttachManifestDigests(ArchivePackage& pkg) const {
    const IRangeSource& source = source_ ? *source_ : DefaultSource();

    std::string text;
    auto r = ReadRangeToString(source, pkg.path, pkg.manifest->offset, pkg.manifest->size, text);
    if (!r.ok) {
        return Result::Fail(r.code, "failed to read manifest " + pkg.manifest->name + ": " + r.msg);
    }

    const ManifestDigests digests = ChecksumManifestParser{}.Parse(text);
    LogDebug("manifest %s: %zu digest line(s)", pkg.manifest->name.c_str(), digests.size());

    auto attach = [&](ArchiveEntry& e) {
        auto it = digests.find(e.name);
        if (it == digests.end()) return;
        e.checksum = it->second.hex;
        e.checksum_algorithm = it->second.algorithm;
    };

    attach(pkg.descriptor);
    for (auto& p : pkg.payloads) attach(p);
    return Result::Ok();
}

Result ValidateChecksum(const IRangeSource& source,
                        const std::string& path,
                        const ArchiveEntry& entry) {
    if (entry.checksum.empty()) return Result::Ok();

    auto algo = entry.checksum_algorithm;
    if (!algo) algo = DigestAlgorithmForHexLength(entry.checksum.size());
    if (!algo) {
        return Result::Fail(ErrorCode::ChecksumMismatch,
                            "cannot determine digest algorithm for " + entry.name);
    }

    std::unique_ptr<IReader> reader;
    auto r = source.OpenRange(path, entry.offset, entry.size, reader);
    if (!r.ok) return r;

    const std::string actual = DigestHex(*algo, *reader);
    if (actual.empty()) {
        const int e = errno;
        return Result::FailErrno(e, "failed to hash " + entry.name + " in " + path + " (" +
                                        std::strerror(e) + ")");
    }

    if (!HexDigestEquals(actual, entry.checksum)) {
        return Result::Fail(ErrorCode::ChecksumMismatch,
                            "checksum mismatch for " + entry.name + ": expected " +
                                entry.checksum + ", got " + actual);
    }

    LogDebug("%s %s verified", DigestAlgorithmName(*algo), entry.name.c_str());
    return Result::Ok();
}

Result ValidateChecksum(const std::string& path, const ArchiveEntry& entry) {
    return ValidateChecksum(DefaultSource(), path, entry);
}

} // namespace ovaup
