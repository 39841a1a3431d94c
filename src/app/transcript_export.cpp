// Copyright (c) 2025 Dualscribe

#include "app/transcript_export.hpp"
#include "app/transcript_json.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace app {

ExportFormat parse_export_format(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "json") return ExportFormat::Json;
    if (n == "text" || n == "txt") return ExportFormat::Text;
    if (n == "csv") return ExportFormat::Csv;
    if (n == "subtitle" || n == "srt") return ExportFormat::Subtitle;
    throw std::invalid_argument("Unsupported export format: " + name);
}

const char* to_string(ExportFormat format) {
    switch (format) {
        case ExportFormat::Json:     return "json";
        case ExportFormat::Text:     return "text";
        case ExportFormat::Csv:      return "csv";
        case ExportFormat::Subtitle: return "subtitle";
    }
    return "json";
}

const char* file_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Json:     return ".json";
        case ExportFormat::Text:     return ".txt";
        case ExportFormat::Csv:      return ".csv";
        case ExportFormat::Subtitle: return ".srt";
    }
    return ".json";
}

std::string csv_field(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

namespace {

std::string export_json(const std::vector<Transcript>& transcripts) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : transcripts) {
        arr.push_back(t);
    }
    return arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string export_text(const std::vector<Transcript>& transcripts) {
    std::ostringstream oss;
    for (size_t i = 0; i < transcripts.size(); ++i) {
        const auto& t = transcripts[i];
        // "HH:MM:SS.mmm" -> "HH:MM:SS"
        oss << '[' << core::format_clock_time(t.timestamp_ms).substr(0, 8) << "] " << t.tagged_text;
        if (i + 1 < transcripts.size()) oss << '\n';
    }
    return oss.str();
}

std::string export_csv(const std::vector<Transcript>& transcripts) {
    std::ostringstream oss;
    oss << "Timestamp,Speaker,Text,Confidence\n";
    for (size_t i = 0; i < transcripts.size(); ++i) {
        const auto& t = transcripts[i];
        std::ostringstream conf;
        conf << t.confidence;
        oss << csv_field(core::format_iso_utc(t.timestamp_ms)) << ','
            << csv_field(t.speaker) << ','
            << csv_field(t.text) << ','
            << csv_field(conf.str());
        if (i + 1 < transcripts.size()) oss << '\n';
    }
    return oss.str();
}

std::string export_srt(const std::vector<Transcript>& transcripts, int64_t time_base_ms, int64_t default_duration_ms) {
    std::ostringstream oss;
    for (size_t i = 0; i < transcripts.size(); ++i) {
        const auto& t = transcripts[i];
        const int64_t start = std::max<int64_t>(0, t.timestamp_ms - time_base_ms);
        const int64_t end_abs = (i + 1 < transcripts.size()) ? transcripts[i + 1].timestamp_ms
                                                             : t.timestamp_ms + default_duration_ms;
        const int64_t end = std::max(start, end_abs - time_base_ms);
        oss << (i + 1) << '\n'
            << core::format_srt_time(start) << " --> " << core::format_srt_time(end) << '\n'
            << t.tagged_text << "\n\n";
    }
    return oss.str();
}

} // namespace

std::string export_transcripts(const std::vector<Transcript>& transcripts,
                               ExportFormat format,
                               int64_t time_base_ms,
                               int64_t default_duration_ms) {
    switch (format) {
        case ExportFormat::Json:     return export_json(transcripts);
        case ExportFormat::Text:     return export_text(transcripts);
        case ExportFormat::Csv:      return export_csv(transcripts);
        case ExportFormat::Subtitle: return export_srt(transcripts, time_base_ms, default_duration_ms);
    }
    return export_json(transcripts);
}

std::vector<Transcript> parse_json_export(const std::string& text) {
    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_array()) {
            throw std::invalid_argument("transcript export must be a JSON array");
        }
        return j.get<std::vector<Transcript>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("malformed transcript export: ") + e.what());
    }
}

} // namespace app
