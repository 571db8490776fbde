#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ovaup {

enum class DigestAlgorithm {
    Sha1,
    Sha256,
    Sha512,
};

// Accepts the manifest spellings "SHA1", "SHA256", "SHA512" (case-insensitive).
std::optional<DigestAlgorithm> ParseDigestAlgorithm(std::string_view name);
const char* DigestAlgorithmName(DigestAlgorithm algo);

// Algorithm whose hex digest has this many characters, if any.
std::optional<DigestAlgorithm> DigestAlgorithmForHexLength(std::size_t hex_len);

std::string DigestHex(DigestAlgorithm algo, std::span<const std::uint8_t> data);

// Hashes the reader to EOF. Returns an empty string on read or digest failure.
std::string DigestHex(DigestAlgorithm algo, IReader& reader);

class Hasher {
public:
    explicit Hasher(DigestAlgorithm algo);
    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;
    ~Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ovaup
