// Copyright (c) 2025 Dualscribe
#pragma once
#include "app/transcript_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace app {

/// Accepts "json", "text"/"txt", "csv", "subtitle"/"srt" (any case).
/// @throws std::invalid_argument for anything else
ExportFormat parse_export_format(const std::string& name);

const char* to_string(ExportFormat format);
const char* file_extension(ExportFormat format);

/// Renders transcripts in the given format.
/// @param time_base_ms subtitle times are relative to this (session start)
/// @param default_duration_ms subtitle duration of the last entry
std::string export_transcripts(const std::vector<Transcript>& transcripts,
                               ExportFormat format,
                               int64_t time_base_ms,
                               int64_t default_duration_ms = 3000);

/// Reads back the output of export_transcripts(..., ExportFormat::Json, ...).
/// @throws std::invalid_argument on malformed input
std::vector<Transcript> parse_json_export(const std::string& text);

/// CSV field with RFC 4180 quoting.
std::string csv_field(const std::string& value);

} // namespace app
