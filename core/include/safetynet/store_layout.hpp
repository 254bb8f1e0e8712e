#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace safetynet {

using Clock = std::chrono::system_clock;

// strftime/get_time format of a session directory name, e.g. 20240115-093000
inline constexpr const char* kSessionIdFormat = "%Y%m%d-%H%M%S";
inline constexpr const char* kStoreDirName = ".safetynet-unsaved";

// Sessions older than this are removed by the startup sweep.
inline constexpr std::chrono::hours kRetention {24 * 7 * 4};

std::string format_session_id(Clock::time_point t);

// Returns nullopt for anything that is not exactly a session id.
std::optional<Clock::time_point> parse_session_id(const std::string& name);

// $HOME/.safetynet-unsaved (falls back to the working directory without HOME)
std::filesystem::path default_store_root();

// Maps a display name onto a single path component inside the session dir.
std::string snapshot_file_name(const std::string& display_name);

// Hidden sibling a snapshot is written to before it is renamed into place.
std::string partial_file_name(const std::string& file_name);
bool is_partial_file(const std::string& file_name);

// Where this process keeps its snapshots. Fixed at process start.
struct StoreLayout {
    std::filesystem::path root;
    std::string sessionId;

    std::filesystem::path sessionDir() const { return root / sessionId; }
    std::filesystem::path snapshotPath(const std::string& display_name) const {
        return sessionDir() / snapshot_file_name(display_name);
    }

    static StoreLayout forProcessStart(std::filesystem::path root = default_store_root());
};

} // namespace safetynet
