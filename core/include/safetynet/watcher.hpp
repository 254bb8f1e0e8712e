#pragma once

#include "safetynet/config.hpp"
#include "safetynet/host.hpp"
#include "safetynet/session_store.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace safetynet {

enum class WatchState {
    Inactive,
    Watching,
};

const char* to_string(WatchState s);

// Autosave lifecycle of one unnamed document: snapshots its text into the
// current session directory on every timer tick until the document is saved
// under a name. Destroying a watcher stops it but keeps the snapshot.
class DocumentWatcher {
public:
    DocumentWatcher(IDocument& doc, IScheduler& scheduler, const SessionStore& store,
                    const AutosaveConfig& config);
    ~DocumentWatcher();

    DocumentWatcher(const DocumentWatcher&) = delete;
    DocumentWatcher& operator=(const DocumentWatcher&) = delete;

    // Inactive -> Watching when autosave is enabled and the document is untitled.
    bool start();
    // One autosave pass. Stop is only returned when the watcher is not watching.
    TimerAction tick();
    // The document was saved under a name: stop and drop the snapshot.
    void onSaved();
    // Teardown without a save. The snapshot stays on disk.
    void stop();

    WatchState state() const { return state_; }
    bool isWatching() const { return state_ == WatchState::Watching; }
    const std::filesystem::path& snapshotPath() const { return snapshotPath_; }
    // Whether the last tick that had something to store managed to store it.
    bool lastWriteOk() const { return lastWriteOk_; }

private:
    bool transition(WatchState from, WatchState to, const char* op);
    void unhook();
    void cleanupSnapshot();

    IDocument& doc_;
    IScheduler& scheduler_;
    const SessionStore& store_;
    AutosaveConfig config_;
    std::string name_;
    WatchState state_ {WatchState::Inactive};
    std::filesystem::path snapshotPath_;
    std::optional<TimerHandle> timer_;
    std::optional<SubscriptionId> savedSub_;
    bool lastWriteOk_ {true};
};

} // namespace safetynet
