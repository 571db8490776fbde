#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace ovaup::config {

void UploaderConfigFromFile::Reset() {
    *this = UploaderConfigFromFile{};
}

Result UploaderConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    auto r = detail::LoadJsonObjectFromFile(path, json);
    if (!r.ok) return r;

    std::string err;
    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorCode::InvalidArgument, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace ovaup::config
