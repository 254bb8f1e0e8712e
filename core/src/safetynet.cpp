#include "safetynet/safetynet.hpp"
#include "safetynet/log.hpp"

namespace safetynet {

SafetyNet::SafetyNet(StoreLayout layout, IScheduler& scheduler, const IConfigProvider& settings)
    : store_(std::move(layout)), scheduler_(scheduler), settings_(settings) {}

SweepReport SafetyNet::onAppStart() {
    config_ = AutosaveConfig::load(settings_);
    started_ = true;
    logger()->debug("Session {} storing under {}", store_.layout().sessionId,
                    store_.layout().root.string());

    const SweepReport r = store_.sweepOldSessions();
    if (r.removed > 0 || r.failed > 0) {
        logger()->info("Old-session cleanup: {} removed, {} kept, {} failed", r.removed, r.kept, r.failed);
    }
    return r;
}

void SafetyNet::onDocumentOpen(IDocument& doc) {
    if (!started_) {
        logger()->warn("[{}] Document opened before activation; reading settings now.", doc.displayName());
        config_ = AutosaveConfig::load(settings_);
        started_ = true;
    }
    if (watchers_.count(&doc) != 0) {
        logger()->debug("[{}] Document is already tracked.", doc.displayName());
        return;
    }

    auto watcher = std::make_unique<DocumentWatcher>(doc, scheduler_, store_, config_);
    if (watcher->start()) {
        logger()->info("[{}] Watching unsaved document.", doc.displayName());
    }
    watchers_.emplace(&doc, std::move(watcher));
}

void SafetyNet::onDocumentClose(IDocument& doc) {
    auto it = watchers_.find(&doc);
    if (it == watchers_.end()) return;
    it->second->stop();
    watchers_.erase(it);
}

const DocumentWatcher* SafetyNet::watcherFor(const IDocument& doc) const {
    auto it = watchers_.find(&doc);
    return it == watchers_.end() ? nullptr : it->second.get();
}

DocumentWatcher* SafetyNet::watcherFor(const IDocument& doc) {
    auto it = watchers_.find(&doc);
    return it == watchers_.end() ? nullptr : it->second.get();
}

} // namespace safetynet
