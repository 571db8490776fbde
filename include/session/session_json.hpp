#pragma once

#include "session/session_types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <string>

namespace ovaup {

// RFC 3339 UTC with milliseconds, e.g. "2026-10-19T08:15:30.250Z".
std::string FormatSessionTime(SessionTime t);
// Accepts the form above plus an optional fractional part of any length
// and a "Z" or "+hh:mm"/"-hh:mm" offset.
std::optional<SessionTime> ParseSessionTime(const std::string& s);

void to_json(nlohmann::json& j, const ItemProgress& p);
void from_json(const nlohmann::json& j, ItemProgress& p);
void to_json(nlohmann::json& j, const UploadSession& s);
void from_json(const nlohmann::json& j, UploadSession& s);

std::string SerializeSession(const UploadSession& s);
std::expected<UploadSession, std::string> DeserializeSession(const std::string& text);

} // namespace ovaup
