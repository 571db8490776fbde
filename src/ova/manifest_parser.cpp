#include "ova/manifest_parser.hpp"

#include <cctype>

namespace ovaup {

namespace {

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

bool IsHex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

std::string_view Trim(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return s;
}

char ToLower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

} // namespace

bool ChecksumManifestParser::ParseLine(std::string_view line,
                                       std::string& name,
                                       ManifestDigest& out) {
    line = Trim(line);
    if (line.empty()) return false;

    const size_t open = line.find('(');
    if (open == std::string_view::npos) return false;

    const auto algo = ParseDigestAlgorithm(Trim(line.substr(0, open)));
    if (!algo) return false;

    const size_t close = line.find(')', open + 1);
    if (close == std::string_view::npos || close == open + 1) return false;

    std::string_view rest = line.substr(close + 1);
    while (!rest.empty() && IsSpace(rest.front())) rest.remove_prefix(1);
    if (rest.empty() || rest.front() != '=') return false;
    rest.remove_prefix(1);
    while (!rest.empty() && IsSpace(rest.front())) rest.remove_prefix(1);

    size_t hex_len = 0;
    while (hex_len < rest.size() && IsHex(rest[hex_len])) ++hex_len;
    if (hex_len == 0) return false;

    name.assign(line.substr(open + 1, close - open - 1));
    out.algorithm = *algo;
    out.hex.clear();
    out.hex.reserve(hex_len);
    for (size_t i = 0; i < hex_len; ++i) out.hex.push_back(ToLower(rest[i]));
    return true;
}

ManifestDigests ChecksumManifestParser::Parse(std::string_view text) const {
    ManifestDigests out;
    while (!text.empty()) {
        const size_t nl = text.find('\n');
        const std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

        std::string name;
        ManifestDigest digest;
        if (ParseLine(line, name, digest)) {
            out[name] = std::move(digest);
        }
    }
    return out;
}

bool HexDigestEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ToLower(a[i]) != ToLower(b[i])) return false;
    }
    return true;
}

} // namespace ovaup
