#pragma once

#include "util/config_parser.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace ovaup::config::detail {

// Io when the file cannot be opened, Parse when it is not a JSON object.
Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);
bool FillConfigFromJson(const nlohmann::json& j, UploaderConfigFromFile& cfg, std::string& err);

} // namespace ovaup::config::detail
