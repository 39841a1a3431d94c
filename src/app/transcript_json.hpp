// Copyright (c) 2025 Dualscribe
// nlohmann::json conversions for transcript data (found by ADL).

#pragma once
#include "app/transcript_types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace app {

/// Text as every JSON writer stores it: invalid UTF-8 sequences become U+FFFD.
std::string valid_utf8(const std::string& text);

void to_json(nlohmann::json& j, const Transcript& t);
void from_json(const nlohmann::json& j, Transcript& t);

void to_json(nlohmann::json& j, const SpeakerStats& s);
void from_json(const nlohmann::json& j, SpeakerStats& s);

void to_json(nlohmann::json& j, const SessionSummary& s);
void from_json(const nlohmann::json& j, SessionSummary& s);

} // namespace app
