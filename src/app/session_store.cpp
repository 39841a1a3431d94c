// Copyright (c) 2025 Dualscribe

#include "app/session_store.hpp"
#include "app/transcript_json.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace app {

namespace fs = std::filesystem;
using nlohmann::json;

SessionStore::SessionStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string SessionStore::path_for(const Session& session) const {
    const std::string name = "session_" + core::format_file_stamp(session.start_ms) + ".json";
    return (fs::path(directory_) / name).string();
}

std::string SessionStore::save(const Session& session,
                               const std::vector<Transcript>& transcripts,
                               const SessionSummary& summary) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw core::PersistenceError("cannot create " + directory_ + ": " + ec.message());
    }

    json doc = {
        {"id", session.id},
        {"startTime", session.start_ms},
        {"endTime", session.end_ms ? json(*session.end_ms) : json(nullptr)},
        {"metadata", session.metadata},
        {"transcripts", transcripts},
        {"summary", summary},
        {"exportedAt", core::now_ms()},
    };

    const std::string path = path_for(session);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw core::PersistenceError("cannot open " + tmp + " for writing");
        }
        out << doc.dump(2, ' ', false, json::error_handler_t::replace);
        out.flush();
        if (!out) {
            throw core::PersistenceError("write failed for " + tmp);
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw core::PersistenceError("cannot move session file into place: " + path);
    }
    core::log_debug("[store] saved " + path + " (" + std::to_string(transcripts.size()) + " transcripts)");
    return path;
}

SessionRecord SessionStore::load(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::PersistenceError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        const json doc = json::parse(buffer.str());
        SessionRecord rec;
        rec.session.id = doc.at("id").get<std::string>();
        rec.session.start_ms = doc.at("startTime").get<int64_t>();
        auto end = doc.find("endTime");
        if (end != doc.end() && !end->is_null()) {
            rec.session.end_ms = end->get<int64_t>();
        }
        rec.session.metadata = doc.value("metadata", Metadata{});
        rec.transcripts = doc.at("transcripts").get<std::vector<Transcript>>();
        rec.summary = doc.value("summary", SessionSummary{});
        rec.exported_at_ms = doc.value("exportedAt", int64_t{0});
        return rec;
    } catch (const json::exception& e) {
        throw core::PersistenceError("malformed session file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw core::PersistenceError("malformed session file " + path + ": " + e.what());
    }
}

std::vector<std::string> SessionStore::list() const {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) return files;

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind("session_", 0) == 0 && entry.path().extension() == ".json") {
            files.push_back(entry.path().string());
        }
    }
    // Stamps sort lexicographically in time order.
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace app
