#pragma once

#include "safetynet/store_layout.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace safetynet {

struct SweepReport {
    std::size_t scanned {0}; // session directories looked at
    std::size_t removed {0};
    std::size_t kept {0};    // younger than the retention threshold
    std::size_t skipped {0}; // foreign entries and the live session
    std::size_t failed {0};
};

struct SessionInfo {
    std::string sessionId;
    std::filesystem::path dir;
    std::vector<std::string> files;
};

// Owns the store root. Only the sweep deletes other sessions; the live session
// directory is written through the snapshot helpers below.
class SessionStore {
public:
    explicit SessionStore(StoreLayout layout, std::chrono::hours retention = kRetention);

    const StoreLayout& layout() const { return layout_; }

    // Removes every session directory older than the retention threshold.
    SweepReport sweepOldSessions(Clock::time_point now = Clock::now()) const;

    // Sessions on disk in chronological order, with their snapshot files.
    std::vector<SessionInfo> listSessions() const;

    bool ensureSessionDir() const;
    // Replaces `path` with `text` through a sibling temp file and a rename.
    bool writeSnapshot(const std::filesystem::path& path, const std::string& text) const;
    // True when the file is gone afterwards (including when it never existed).
    bool removeSnapshot(const std::filesystem::path& path) const;
    // Deletes the live session directory if nothing is left in it.
    bool removeSessionDirIfEmpty() const;

private:
    bool removeSessionDir(const std::filesystem::path& dir) const;

    StoreLayout layout_;
    std::chrono::hours retention_;
};

} // namespace safetynet
