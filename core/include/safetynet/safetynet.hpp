#pragma once

#include "safetynet/config.hpp"
#include "safetynet/host.hpp"
#include "safetynet/session_store.hpp"
#include "safetynet/watcher.hpp"
#include <cstddef>
#include <map>
#include <memory>

namespace safetynet {

// Process-wide wiring between the host's activation hooks and the watchers.
// Documents passed to onDocumentOpen must stay alive until onDocumentClose.
class SafetyNet {
public:
    SafetyNet(StoreLayout layout, IScheduler& scheduler, const IConfigProvider& settings);

    // Reads the autosave settings once and sweeps stale sessions.
    SweepReport onAppStart();
    void onDocumentOpen(IDocument& doc);
    void onDocumentClose(IDocument& doc);

    const AutosaveConfig& config() const { return config_; }
    const SessionStore& store() const { return store_; }
    // nullptr when the document is not open
    const DocumentWatcher* watcherFor(const IDocument& doc) const;
    DocumentWatcher* watcherFor(const IDocument& doc);
    std::size_t openDocuments() const { return watchers_.size(); }

private:
    SessionStore store_;
    IScheduler& scheduler_;
    const IConfigProvider& settings_;
    AutosaveConfig config_;
    bool started_ {false};
    std::map<const IDocument*, std::unique_ptr<DocumentWatcher>> watchers_;
};

} // namespace safetynet
