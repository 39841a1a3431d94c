// Copyright (c) 2025 Dualscribe
#pragma once
#include "app/transcript_types.hpp"

#include <string>
#include <vector>

namespace app {

/// Contents of one session file.
struct SessionRecord {
    Session session;
    std::vector<Transcript> transcripts;
    SessionSummary summary;
    int64_t exported_at_ms = 0;
};

/// One JSON file per session under a directory, named by the session start
/// time: session_2025-03-01T14-05-09-123Z.json. Writes go to a temp file
/// that is renamed over the target.
class SessionStore {
public:
    explicit SessionStore(std::string directory);

    const std::string& directory() const { return directory_; }

    std::string path_for(const Session& session) const;

    /// @return path written
    /// @throws core::PersistenceError
    std::string save(const Session& session,
                     const std::vector<Transcript>& transcripts,
                     const SessionSummary& summary) const;

    /// @throws core::PersistenceError when unreadable or malformed
    SessionRecord load(const std::string& path) const;

    /// Session files in the directory, oldest first.
    std::vector<std::string> list() const;

private:
    std::string directory_;
};

} // namespace app
