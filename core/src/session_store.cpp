#include "safetynet/session_store.hpp"
#include "safetynet/log.hpp"
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace safetynet {

static std::vector<fs::path> sorted_entries(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

SessionStore::SessionStore(StoreLayout layout, std::chrono::hours retention)
    : layout_(std::move(layout)), retention_(retention) {}

SweepReport SessionStore::sweepOldSessions(Clock::time_point now) const {
    SweepReport report;
    auto log = logger();
    log->debug("Doing old-session cleanup.");

    std::error_code ec;
    if (!fs::is_directory(layout_.root, ec)) {
        log->debug("The storage path doesn't exist: {}", layout_.root.string());
        return report;
    }

    const auto subdirs = sorted_entries(layout_.root, ec);
    if (ec) {
        log->error("Could not list storage path {}: {}", layout_.root.string(), ec.message());
        return report;
    }
    log->debug("({}) session-backup directories found.", subdirs.size());

    for (const auto& path : subdirs) {
        const std::string name = path.filename().string();
        if (!fs::is_directory(path, ec)) {
            log->debug("Ignoring non-directory entry: {}", name);
            ++report.skipped;
            continue;
        }
        ++report.scanned;
        if (name == layout_.sessionId) {
            log->debug("[{}] is the current session.", name);
            ++report.skipped;
            continue;
        }

        const auto started = parse_session_id(name);
        if (!started) {
            log->warn("Ignoring directory that is not a session: {}", path.string());
            ++report.skipped;
            continue;
        }

        const auto age = now - *started;
        if (age < retention_) {
            const double days = std::chrono::duration<double>(age).count() / 86400.0;
            log->debug("[{}] is too recent: ({:.2f}) days", name, days);
            ++report.kept;
            continue;
        }

        log->info("Cleaning-up temporary storage for old session: {}", name);
        if (removeSessionDir(path)) {
            ++report.removed;
        } else {
            ++report.failed;
        }
    }
    return report;
}

bool SessionStore::removeSessionDir(const fs::path& dir) const {
    auto log = logger();
    std::error_code ec;
    const auto files = sorted_entries(dir, ec);
    if (ec) {
        log->error("Could not list {}: {}", dir.string(), ec.message());
        return false;
    }
    for (const auto& file : files) {
        log->info("Removing: {}", file.filename().string());
        fs::remove(file, ec);
        if (ec) {
            log->error("Could not remove {}: {}", file.string(), ec.message());
            ec.clear();
        }
    }

    log->info("Removing directory for session: {}", dir.string());
    fs::remove(dir, ec);
    if (ec) {
        log->error("Could not remove {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

std::vector<SessionInfo> SessionStore::listSessions() const {
    std::vector<SessionInfo> out;
    std::error_code ec;
    if (!fs::is_directory(layout_.root, ec)) return out;

    for (const auto& path : sorted_entries(layout_.root, ec)) {
        const std::string name = path.filename().string();
        if (!fs::is_directory(path, ec) || !parse_session_id(name)) continue;
        SessionInfo info {name, path, {}};
        for (const auto& file : sorted_entries(path, ec)) {
            const std::string file_name = file.filename().string();
            // Leftovers of an interrupted write are not recoverable text.
            if (!fs::is_regular_file(file, ec) || is_partial_file(file_name)) continue;
            info.files.push_back(file_name);
        }
        out.emplace_back(std::move(info));
    }
    return out;
}

bool SessionStore::ensureSessionDir() const {
    const fs::path dir = layout_.sessionDir();
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return true;

    logger()->info("Creating temporary unsaved store path: {}", dir.string());
    fs::create_directories(dir, ec);
    if (ec) {
        logger()->error("Could not create {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

bool SessionStore::writeSnapshot(const fs::path& path, const std::string& text) const {
    // Hidden sibling so a crash mid-write never truncates the last good snapshot.
    const fs::path partial = path.parent_path() / partial_file_name(path.filename().string());
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            logger()->error("Could not open {} for writing", partial.string());
            return false;
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (out.fail()) {
            logger()->error("Could not write {}", partial.string());
            std::error_code ignored;
            fs::remove(partial, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(partial, path, ec);
    if (ec) {
        logger()->error("Could not move snapshot into place at {}: {}", path.string(), ec.message());
        std::error_code ignored;
        fs::remove(partial, ignored);
        return false;
    }
    return true;
}

bool SessionStore::removeSnapshot(const fs::path& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logger()->error("Could not remove temporary file {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool SessionStore::removeSessionDirIfEmpty() const {
    const fs::path dir = layout_.sessionDir();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return true;

    if (!fs::is_empty(dir, ec)) {
        if (ec) {
            logger()->error("Could not inspect {}: {}", dir.string(), ec.message());
            return false;
        }
        logger()->debug("Other temporary files still exist for this session.");
        return true;
    }

    logger()->info("No more temporary files exist for this session. Removing storage path: {}",
                   dir.string());
    fs::remove(dir, ec);
    if (ec) {
        logger()->error("Could not remove {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace safetynet
