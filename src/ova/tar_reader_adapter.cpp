#include "ova/tar_reader_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>
#include <cstdint>
#include <vector>

namespace ovaup {

namespace {

struct ReaderCtx {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ReaderCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive*, void* client_data, const void** out_buf) {
    if (g_cancel.load(std::memory_order_relaxed)) {
        errno = EINTR;
        return -1;
    }

    auto* ctx = static_cast<ReaderCtx*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) return -1;

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

la_int64_t SkipCb(struct archive*, void* client_data, la_int64_t request) {
    if (request <= 0) return 0;
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    return static_cast<la_int64_t>(ctx->reader->Skip(static_cast<std::uint64_t>(request)));
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, IReader& reader) {
    auto* ctx = new ReaderCtx(reader);
    // ctx belongs to libarchive from here on; CloseCb runs on close or free.
    return archive_read_open2(ar, ctx, nullptr, ReadCb, SkipCb, CloseCb);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace ovaup
