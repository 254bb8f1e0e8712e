#include "safetynet/watcher.hpp"
#include "safetynet/log.hpp"

namespace safetynet {

const char* to_string(WatchState s) {
    switch (s) {
    case WatchState::Inactive: return "inactive";
    case WatchState::Watching: return "watching";
    }
    return "unknown";
}

DocumentWatcher::DocumentWatcher(IDocument& doc, IScheduler& scheduler, const SessionStore& store,
                                 const AutosaveConfig& config)
    : doc_(doc), scheduler_(scheduler), store_(store), config_(config) {}

DocumentWatcher::~DocumentWatcher() {
    if (isWatching()) stop();
}

bool DocumentWatcher::transition(WatchState from, WatchState to, const char* op) {
    if (state_ != from) {
        logger()->debug("[{}] Ignoring {} while {}.", doc_.displayName(), op, to_string(state_));
        return false;
    }
    state_ = to;
    return true;
}

bool DocumentWatcher::start() {
    const std::string name = doc_.displayName();
    auto log = logger();

    if (!config_.enabled) {
        log->warn("[{}] Plugin will not do anything because autosave is not enabled.", name);
        return false;
    }
    if (!doc_.isUntitled()) {
        log->debug("[{}] Document is already assigned a name. Skipping.", name);
        return false;
    }
    if (!transition(WatchState::Inactive, WatchState::Watching, "start")) return false;

    log->debug("[{}] Starting watch.", name);
    name_ = name;
    snapshotPath_ = store_.layout().snapshotPath(name_);

    // Named saves arrive through this; our own snapshots never raise it.
    savedSub_ = doc_.onSaved([this] { onSaved(); });

    log->debug("[{}] Scheduling save for ({}) second intervals.", name_, config_.interval().count());
    timer_ = scheduler_.every(config_.interval(), [this] { return tick(); });
    return true;
}

TimerAction DocumentWatcher::tick() {
    if (state_ != WatchState::Watching) {
        logger()->debug("[{}] Tick after the watch ended.", doc_.displayName());
        return TimerAction::Stop;
    }

    auto log = logger();
    log->debug("[{}] Checking state of unsaved document.", name_);
    if (doc_.isUntouched()) {
        log->debug("[{}] Unsaved document has not been touched and will not be stored/updated on disk.",
                   name_);
        return TimerAction::Continue;
    }

    if (!store_.ensureSessionDir()) {
        lastWriteOk_ = false;
        return TimerAction::Continue;
    }

    const std::string text = doc_.fullText();
    log->info("[{}] Storing unnamed file as ({}) bytes to: {}", name_, text.size(), snapshotPath_.string());
    lastWriteOk_ = store_.writeSnapshot(snapshotPath_, text);
    return TimerAction::Continue;
}

void DocumentWatcher::onSaved() {
    if (!transition(WatchState::Watching, WatchState::Inactive, "saved")) return;
    logger()->debug("[{}] Document was saved under a name.", name_);
    unhook();
    cleanupSnapshot();
}

void DocumentWatcher::stop() {
    if (!transition(WatchState::Watching, WatchState::Inactive, "stop")) return;
    logger()->debug("[{}] Stopping watch.", name_);
    unhook();
}

void DocumentWatcher::unhook() {
    if (timer_) {
        logger()->debug("[{}] Cancelling save schedule.", name_);
        scheduler_.cancel(*timer_);
        timer_.reset();
    }
    if (savedSub_) {
        logger()->debug("[{}] Removing 'saved' signal handler.", name_);
        doc_.off(*savedSub_);
        savedSub_.reset();
    }
}

void DocumentWatcher::cleanupSnapshot() {
    logger()->info("[{}] Cleaning-up temporary file: {}", name_, snapshotPath_.string());
    if (!store_.removeSnapshot(snapshotPath_)) return;
    if (!store_.removeSessionDirIfEmpty()) {
        logger()->warn("[{}] Session directory left behind: {}", name_,
                       store_.layout().sessionDir().string());
    }
}

} // namespace safetynet
