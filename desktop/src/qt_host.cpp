#include "safetynet/qt_host.hpp"
#include "safetynet/config.hpp"
#include "safetynet/log.hpp"
#include <QFileInfo>
#include <QPlainTextEdit>
#include <QSaveFile>
#include <QTextDocument>
#include <QTimer>
#include <stdexcept>

namespace safetynet {

QtScheduler::~QtScheduler() {
    for (auto& kv : timers_) kv.second->stop();
}

TimerHandle QtScheduler::every(std::chrono::seconds interval, TimerCallback cb) {
    const TimerHandle h = next_++;
    auto* timer = new QTimer(this);
    timer->setInterval(std::chrono::milliseconds(interval));
    connect(timer, &QTimer::timeout, this, [this, h, cb = std::move(cb)]() {
        if (cb() == TimerAction::Stop) cancel(h);
    });
    timers_[h] = timer;
    timer->start();
    return h;
}

void QtScheduler::cancel(TimerHandle handle) {
    auto it = timers_.find(handle);
    if (it == timers_.end()) return;
    it->second->stop();
    // May be called from inside the timer's own timeout.
    it->second->deleteLater();
    timers_.erase(it);
}

QtDocument::QtDocument(QPlainTextEdit* editor, QString untitled_name)
    : QObject(editor), editor_(editor), untitledName_(std::move(untitled_name)) {}

std::string QtDocument::displayName() const {
    if (path_.isEmpty()) return untitledName_.toStdString();
    return QFileInfo(path_).fileName().toStdString();
}

bool QtDocument::isUntouched() const {
    const QTextDocument* doc = editor_->document();
    return !doc->isModified() && !doc->isUndoAvailable();
}

std::string QtDocument::fullText() const {
    return editor_->toPlainText().toStdString();
}

SubscriptionId QtDocument::onSaved(SavedHandler handler) {
    const SubscriptionId id = next_++;
    connections_[id] = connect(this, &QtDocument::saved, this, std::move(handler));
    return id;
}

void QtDocument::off(SubscriptionId id) {
    auto it = connections_.find(id);
    if (it == connections_.end()) return;
    disconnect(it->second);
    connections_.erase(it);
}

bool QtDocument::saveAs(const QString& path, QString* error) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = file.errorString();
        return false;
    }
    const QByteArray bytes = editor_->toPlainText().toUtf8();
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (error) *error = file.errorString();
        return false;
    }
    path_ = path;
    editor_->document()->setModified(false);
    logger()->debug("Saved {} ({} bytes)", path_.toStdString(), bytes.size());
    emit saved();
    return true;
}

QVariant SettingsConfig::value(const std::string& key) const {
    const QString k = QString::fromStdString(key);
    if (settings_.status() != QSettings::NoError) {
        throw std::runtime_error("settings store is unreadable");
    }
    if (!settings_.contains(k)) throw std::runtime_error("missing setting " + key);
    return settings_.value(k);
}

bool SettingsConfig::getBoolean(const std::string& key) const {
    return value(key).toBool();
}

unsigned SettingsConfig::getUint(const std::string& key) const {
    bool ok = false;
    const uint v = value(key).toUInt(&ok);
    if (!ok) throw std::runtime_error("setting " + key + " is not an unsigned integer");
    return v;
}

void SettingsConfig::seedDefaults(QSettings& settings) {
    if (!settings.contains(kAutosaveEnabledKey)) settings.setValue(kAutosaveEnabledKey, true);
    if (!settings.contains(kAutosaveIntervalKey)) settings.setValue(kAutosaveIntervalKey, 10u);
}

} // namespace safetynet
