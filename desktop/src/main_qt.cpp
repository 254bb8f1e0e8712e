#ifdef SAFETYNET_QT_SHELL
#include "safetynet/log.hpp"
#include "safetynet/qt_host.hpp"
#include "safetynet/safetynet.hpp"
#include <QAction>
#include <QApplication>
#include <QFile>
#include <QFileDialog>
#include <QInputDialog>
#include <QKeySequence>
#include <QMainWindow>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QSettings>
#include <QStatusBar>
#include <QTabWidget>
#include <algorithm>
#include <filesystem>
#include <vector>

using namespace safetynet;

static StoreLayout layout_from_settings(QSettings& settings) {
    const QString root = settings.value("store/root").toString();
    if (root.isEmpty()) return StoreLayout::forProcessStart();
    return StoreLayout::forProcessStart(root.toStdString());
}

class MainWindow : public QMainWindow {
public:
    explicit MainWindow(QSettings& settings)
        : settings_(settings), config_(settings),
          net_(layout_from_settings(settings), scheduler_, config_) {
        setWindowTitle("SafetyNet Editor");
        tabs_ = new QTabWidget(this);
        tabs_->setTabsClosable(true);
        tabs_->setDocumentMode(true);
        setCentralWidget(tabs_);

        auto* fileMenu = menuBar()->addMenu("&File");
        auto* newAct = fileMenu->addAction("&New");
        newAct->setShortcut(QKeySequence::New);
        auto* saveAct = fileMenu->addAction("Save &As...");
        saveAct->setShortcut(QKeySequence::SaveAs);
        auto* recoverAct = fileMenu->addAction("&Recover Unsaved...");
        fileMenu->addSeparator();
        auto* closeAct = fileMenu->addAction("&Close Tab");
        closeAct->setShortcut(QKeySequence::Close);

        auto* prefsMenu = menuBar()->addMenu("&Preferences");
        auto* autosaveAct = prefsMenu->addAction("Snapshot Unsaved Documents");
        autosaveAct->setCheckable(true);
        autosaveAct->setChecked(settings_.value(kAutosaveEnabledKey).toBool());

        connect(newAct, &QAction::triggered, this, [this]() { newTab(); });
        connect(saveAct, &QAction::triggered, this, [this]() { saveCurrent(); });
        connect(recoverAct, &QAction::triggered, this, [this]() { recover(); });
        connect(closeAct, &QAction::triggered, this, [this]() { closeTab(tabs_->currentIndex()); });
        connect(tabs_, &QTabWidget::tabCloseRequested, this, [this](int i) { closeTab(i); });
        connect(autosaveAct, &QAction::toggled, this, [this](bool on) {
            settings_.setValue(kAutosaveEnabledKey, on);
            statusBar()->showMessage("Autosave change applies on next start", 3000);
        });

        const SweepReport r = net_.onAppStart();
        if (net_.config().enabled) {
            statusBar()->showMessage(QString("Autosave: every %1 min, %2 old session(s) cleaned")
                                         .arg(net_.config().intervalMinutes)
                                         .arg(r.removed));
        } else {
            statusBar()->showMessage("Autosave: Off");
        }
        newTab();
    }

    ~MainWindow() override {
        // Watchers must go before the documents they observe.
        while (!docs_.empty()) {
            net_.onDocumentClose(*docs_.back());
            docs_.pop_back();
        }
    }

private:
    QtDocument* newTab(const QString& text = QString()) {
        auto* editor = new QPlainTextEdit;
        editor->setPlainText(text);
        const QString name = QString("Untitled Document %1").arg(++untitledCount_);
        auto* doc = new QtDocument(editor, name);
        docs_.push_back(doc);
        tabs_->setCurrentIndex(tabs_->addTab(editor, name));
        net_.onDocumentOpen(*doc);
        return doc;
    }

    QtDocument* docAt(int index) const {
        QWidget* w = tabs_->widget(index);
        for (auto* d : docs_) {
            if (d->editor() == w) return d;
        }
        return nullptr;
    }

    void saveCurrent() {
        const int index = tabs_->currentIndex();
        QtDocument* doc = docAt(index);
        if (!doc) return;
        const QString path = QFileDialog::getSaveFileName(this, "Save As", doc->path());
        if (path.isEmpty()) return;
        QString error;
        if (!doc->saveAs(path, &error)) {
            QMessageBox::warning(this, "Save failed", error);
            return;
        }
        tabs_->setTabText(index, QString::fromStdString(doc->displayName()));
    }

    void closeTab(int index) {
        QtDocument* doc = docAt(index);
        if (!doc) return;
        net_.onDocumentClose(*doc);
        docs_.erase(std::remove(docs_.begin(), docs_.end(), doc), docs_.end());
        QWidget* editor = tabs_->widget(index);
        tabs_->removeTab(index);
        delete editor;
    }

    // Opens a snapshot from any stored session as a new untitled tab.
    void recover() {
        QStringList items;
        std::vector<std::filesystem::path> paths;
        for (const auto& s : net_.store().listSessions()) {
            for (const auto& f : s.files) {
                items << QString::fromStdString(s.sessionId + " / " + f);
                paths.push_back(s.dir / f);
            }
        }
        if (items.isEmpty()) {
            QMessageBox::information(this, "Recover", "No unsaved snapshots were found.");
            return;
        }
        bool ok = false;
        const QString choice = QInputDialog::getItem(this, "Recover", "Snapshot:", items, 0, false, &ok);
        if (!ok) return;
        const auto& path = paths[static_cast<size_t>(items.indexOf(choice))];
        QFile file(QString::fromStdString(path.string()));
        if (!file.open(QIODevice::ReadOnly)) {
            QMessageBox::warning(this, "Recover", file.errorString());
            return;
        }
        newTab(QString::fromUtf8(file.readAll()));
    }

    QSettings& settings_;
    SettingsConfig config_;
    QtScheduler scheduler_;
    SafetyNet net_;
    QTabWidget* tabs_ {nullptr};
    std::vector<QtDocument*> docs_;
    int untitledCount_ {0};
};

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    QApplication::setOrganizationName("safetynet");
    QApplication::setApplicationName("safetynet-editor");

    QSettings settings;
    SettingsConfig::seedDefaults(settings);
    safetynet::logger()->debug("Settings file: {}", settings.fileName().toStdString());

    MainWindow w(settings);
    w.resize(900, 600);
    w.show();
    return app.exec();
}
#endif
