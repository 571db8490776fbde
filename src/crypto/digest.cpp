#include "crypto/digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <vector>

namespace ovaup {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

const EVP_MD* MdFor(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Sha1:   return EVP_sha1();
        case DigestAlgorithm::Sha256: return EVP_sha256();
        case DigestAlgorithm::Sha512: return EVP_sha512();
    }
    return nullptr;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitDigest(EvpCtx& ctx, DigestAlgorithm algo) {
    const EVP_MD* md = MdFor(algo);
    return ctx.ok() && md && EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(out.data(), len));
}

} // namespace

std::optional<DigestAlgorithm> ParseDigestAlgorithm(std::string_view name) {
    std::string up;
    up.reserve(name.size());
    for (char c : name) {
        if (c == '-') continue; // "SHA-256"
        up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (up == "SHA1") return DigestAlgorithm::Sha1;
    if (up == "SHA256") return DigestAlgorithm::Sha256;
    if (up == "SHA512") return DigestAlgorithm::Sha512;
    return std::nullopt;
}

const char* DigestAlgorithmName(DigestAlgorithm algo) {
    switch (algo) {
        case DigestAlgorithm::Sha1:   return "SHA1";
        case DigestAlgorithm::Sha256: return "SHA256";
        case DigestAlgorithm::Sha512: return "SHA512";
    }
    return "?";
}

std::optional<DigestAlgorithm> DigestAlgorithmForHexLength(std::size_t hex_len) {
    switch (hex_len) {
        case 40:  return DigestAlgorithm::Sha1;
        case 64:  return DigestAlgorithm::Sha256;
        case 128: return DigestAlgorithm::Sha512;
        default:  return std::nullopt;
    }
}

struct Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

Hasher::Hasher(DigestAlgorithm algo) : impl_(std::make_unique<Impl>()) {
    if (impl_ && InitDigest(impl_->ctx, algo)) {
        impl_->initialized = true;
    }
}

Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;
Hasher::~Hasher() = default;

void Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateDigest(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

std::string Hasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return {};
    impl_->finalized = true;
    return FinalDigestHex(impl_->ctx);
}

std::string DigestHex(DigestAlgorithm algo, std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};
    if (!UpdateDigest(ctx, data)) return {};
    return FinalDigestHex(ctx);
}

std::string DigestHex(DigestAlgorithm algo, IReader& reader) {
    EvpCtx ctx;
    if (!InitDigest(ctx, algo)) return {};

    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!UpdateDigest(ctx, std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }

    return FinalDigestHex(ctx);
}

} // namespace ovaup
