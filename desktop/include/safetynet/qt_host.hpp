#pragma once

#include "safetynet/host.hpp"
#include <QObject>
#include <QSettings>
#include <QString>
#include <cstddef>
#include <map>

class QPlainTextEdit;
class QTimer;

namespace safetynet {

// IScheduler over QTimer; callbacks run on the GUI event loop.
class QtScheduler : public QObject, public IScheduler {
    Q_OBJECT
public:
    explicit QtScheduler(QObject* parent = nullptr) : QObject(parent) {}
    ~QtScheduler() override;

    TimerHandle every(std::chrono::seconds interval, TimerCallback cb) override;
    void cancel(TimerHandle handle) override;
    std::size_t active() const { return timers_.size(); }

private:
    TimerHandle next_ {1};
    std::map<TimerHandle, QTimer*> timers_;
};

// One editor tab. Untitled until saveAs() succeeds.
class QtDocument : public QObject, public IDocument {
    Q_OBJECT
public:
    QtDocument(QPlainTextEdit* editor, QString untitled_name);

    std::string displayName() const override;
    bool isUntitled() const override { return path_.isEmpty(); }
    bool isUntouched() const override;
    std::string fullText() const override;

    SubscriptionId onSaved(SavedHandler handler) override;
    void off(SubscriptionId id) override;

    QPlainTextEdit* editor() const { return editor_; }
    const QString& path() const { return path_; }
    // Writes the text to `path` atomically; emits saved() on success.
    bool saveAs(const QString& path, QString* error = nullptr);

signals:
    void saved();

private:
    QPlainTextEdit* editor_;
    QString untitledName_;
    QString path_;
    SubscriptionId next_ {1};
    std::map<SubscriptionId, QMetaObject::Connection> connections_;
};

// IConfigProvider over QSettings. Missing keys throw.
class SettingsConfig : public IConfigProvider {
public:
    explicit SettingsConfig(QSettings& settings) : settings_(settings) {}

    bool getBoolean(const std::string& key) const override;
    unsigned getUint(const std::string& key) const override;

    // Writes defaults for keys that are not set yet.
    static void seedDefaults(QSettings& settings);

private:
    QVariant value(const std::string& key) const;

    QSettings& settings_;
};

} // namespace safetynet
