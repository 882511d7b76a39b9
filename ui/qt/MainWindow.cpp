#include "MainWindow.hpp"
#include "../../core/Errors.hpp"
#include "../../core/IClock.hpp"
#include "../../core/IRng.hpp"
#include "../../core/adapters/JsonFileTrackingStore.hpp"
#include "../../core/domain/HoursCalculator.hpp"
#include "../../crypto/AuditSigner.hpp"

#include <QDateTime>
#include <QDir>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QSettings>
#include <QStandardPaths>
#include <QStatusBar>
#include <QVBoxLayout>

#include <chrono>

namespace worktrack {
namespace qt {

namespace {

QString toQString(const std::string& text) {
    return QString::fromStdString(text);
}

QString formatTime(Timestamp time) {
    return QDateTime::fromMSecsSinceEpoch(toEpochMillis(time)).toString("yyyy-MM-dd hh:mm:ss");
}

QString formatMinutes(std::int64_t minutes) {
    return QString("%1h %2m").arg(minutes / 60).arg(minutes % 60, 2, 10, QChar('0'));
}

} // namespace

MainWindow::MainWindow(const AppConfig& config, QWidget *parent)
    : QMainWindow(parent)
    , m_clock(std::make_shared<sim::SimulatedClock>(std::chrono::system_clock::now()))
    , m_rng(std::make_shared<StandardRng>())
    , m_provider(std::make_shared<sim::MockLocationProvider>())
    , m_notifications(std::make_shared<UiNotificationDispatcher>())
    , m_eventBus(std::make_shared<domain::EventBus>())
    , m_tickTimer(new QTimer(this))
{
    setupUI();
    loadConfiguration();
    initEngine(config);

    connect(m_tickTimer, &QTimer::timeout, this, &MainWindow::onTick);
    m_tickTimer->setInterval(1000); // 1 second
    m_tickTimer->start();
}

MainWindow::~MainWindow() {
    saveConfiguration();
}

void MainWindow::setupUI() {
    setWindowTitle("Work Tracking Monitor");
    setMinimumSize(900, 600);

    m_tabWidget = new QTabWidget;
    setCentralWidget(m_tabWidget);

    // Sites Tab
    auto* sitesTab = new QWidget;
    m_tabWidget->addTab(sitesTab, "Sites");

    auto* sitesLayout = new QVBoxLayout(sitesTab);

    m_siteTable = new QTableWidget(0, 5);
    m_siteTable->setHorizontalHeaderLabels({"Site", "Radius", "Status", "Since", "Next check"});
    m_siteTable->horizontalHeader()->setStretchLastSection(true);
    m_siteTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_siteTable->setSelectionMode(QAbstractItemView::SingleSelection);
    m_siteTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    sitesLayout->addWidget(m_siteTable);

    auto* siteGroup = new QGroupBox("New Site");
    auto* siteForm = new QFormLayout(siteGroup);

    m_siteNameEdit = new QLineEdit;
    m_siteNameEdit->setPlaceholderText("Head Office");
    siteForm->addRow("Name:", m_siteNameEdit);

    m_siteLatSpin = new QDoubleSpinBox;
    m_siteLatSpin->setRange(-90.0, 90.0);
    m_siteLatSpin->setDecimals(6);
    siteForm->addRow("Latitude:", m_siteLatSpin);

    m_siteLonSpin = new QDoubleSpinBox;
    m_siteLonSpin->setRange(-180.0, 180.0);
    m_siteLonSpin->setDecimals(6);
    siteForm->addRow("Longitude:", m_siteLonSpin);

    m_siteRadiusSpin = new QDoubleSpinBox;
    m_siteRadiusSpin->setRange(0.0, 5000.0);
    m_siteRadiusSpin->setSuffix(" m");
    siteForm->addRow("Radius:", m_siteRadiusSpin);

    auto* siteButtons = new QHBoxLayout;
    m_addSiteButton = new QPushButton("Add Site");
    m_deleteSiteButton = new QPushButton("Delete Selected");
    siteButtons->addWidget(m_addSiteButton);
    siteButtons->addWidget(m_deleteSiteButton);
    siteButtons->addStretch();
    siteForm->addRow(siteButtons);

    sitesLayout->addWidget(siteGroup);

    connect(m_addSiteButton, &QPushButton::clicked, this, &MainWindow::onAddSiteClicked);
    connect(m_deleteSiteButton, &QPushButton::clicked, this, &MainWindow::onDeleteSiteClicked);

    // Tracking Tab
    auto* trackingTab = new QWidget;
    m_tabWidget->addTab(trackingTab, "Tracking");

    auto* trackingLayout = new QVBoxLayout(trackingTab);

    auto* siteSelectGroup = new QGroupBox("Site");
    auto* siteSelectLayout = new QFormLayout(siteSelectGroup);
    m_siteCombo = new QComboBox;
    siteSelectLayout->addRow("Site:", m_siteCombo);
    trackingLayout->addWidget(siteSelectGroup);

    auto* manualGroup = new QGroupBox("Manual Tracking");
    auto* manualLayout = new QHBoxLayout(manualGroup);
    m_clockInButton = new QPushButton("Clock In");
    m_clockOutButton = new QPushButton("Clock Out");
    manualLayout->addWidget(m_clockInButton);
    manualLayout->addWidget(m_clockOutButton);
    manualLayout->addStretch();
    trackingLayout->addWidget(manualGroup);

    auto* geofenceGroup = new QGroupBox("Simulated Geofence Transitions");
    auto* geofenceLayout = new QHBoxLayout(geofenceGroup);
    m_accuracySpin = new QDoubleSpinBox;
    m_accuracySpin->setRange(0.0, 1000.0);
    m_accuracySpin->setValue(20.0);
    m_accuracySpin->setSuffix(" m");
    m_enterButton = new QPushButton("Enter");
    m_exitButton = new QPushButton("Exit");
    geofenceLayout->addWidget(new QLabel("Accuracy:"));
    geofenceLayout->addWidget(m_accuracySpin);
    geofenceLayout->addWidget(m_enterButton);
    geofenceLayout->addWidget(m_exitButton);
    geofenceLayout->addStretch();
    trackingLayout->addWidget(geofenceGroup);

    auto* positionGroup = new QGroupBox("Device Position (used by exit verification)");
    auto* positionForm = new QFormLayout(positionGroup);

    m_fixLatSpin = new QDoubleSpinBox;
    m_fixLatSpin->setRange(-90.0, 90.0);
    m_fixLatSpin->setDecimals(6);
    positionForm->addRow("Latitude:", m_fixLatSpin);

    m_fixLonSpin = new QDoubleSpinBox;
    m_fixLonSpin->setRange(-180.0, 180.0);
    m_fixLonSpin->setDecimals(6);
    positionForm->addRow("Longitude:", m_fixLonSpin);

    m_fixAccuracySpin = new QDoubleSpinBox;
    m_fixAccuracySpin->setRange(0.0, 1000.0);
    m_fixAccuracySpin->setValue(15.0);
    m_fixAccuracySpin->setSuffix(" m");
    positionForm->addRow("Accuracy:", m_fixAccuracySpin);

    auto* positionButtons = new QHBoxLayout;
    m_setPositionButton = new QPushButton("Set Position");
    m_clearPositionButton = new QPushButton("No Fix");
    positionButtons->addWidget(m_setPositionButton);
    positionButtons->addWidget(m_clearPositionButton);
    positionButtons->addStretch();
    positionForm->addRow(positionButtons);

    m_positionLabel = new QLabel("No position fix available");
    positionForm->addRow("Current:", m_positionLabel);
    trackingLayout->addWidget(positionGroup);

    auto* clockGroup = new QGroupBox("Clock");
    auto* clockForm = new QFormLayout(clockGroup);
    m_speedSpin = new QSpinBox;
    m_speedSpin->setRange(1, 120);
    m_speedSpin->setValue(1);
    m_speedSpin->setSuffix("x");
    clockForm->addRow("Speed:", m_speedSpin);
    m_clockLabel = new QLabel;
    m_clockLabel->setStyleSheet("font-weight: bold;");
    clockForm->addRow("Now:", m_clockLabel);
    trackingLayout->addWidget(clockGroup);

    trackingLayout->addStretch();

    connect(m_clockInButton, &QPushButton::clicked, this, &MainWindow::onClockInClicked);
    connect(m_clockOutButton, &QPushButton::clicked, this, &MainWindow::onClockOutClicked);
    connect(m_enterButton, &QPushButton::clicked, this, &MainWindow::onEnterClicked);
    connect(m_exitButton, &QPushButton::clicked, this, &MainWindow::onExitClicked);
    connect(m_setPositionButton, &QPushButton::clicked, this, &MainWindow::onSetPositionClicked);
    connect(m_clearPositionButton, &QPushButton::clicked, this, &MainWindow::onClearPositionClicked);

    // History Tab
    auto* historyTab = new QWidget;
    m_tabWidget->addTab(historyTab, "History");

    auto* historyLayout = new QVBoxLayout(historyTab);
    auto* historyHeader = new QHBoxLayout;
    m_historySiteCombo = new QComboBox;
    m_todayLabel = new QLabel;
    historyHeader->addWidget(new QLabel("Site:"));
    historyHeader->addWidget(m_historySiteCombo);
    historyHeader->addStretch();
    historyHeader->addWidget(m_todayLabel);
    historyLayout->addLayout(historyHeader);

    m_historyTable = new QTableWidget(0, 6);
    m_historyTable->setHorizontalHeaderLabels({"Clock in", "Clock out", "State", "Method", "Duration", "Exit"});
    m_historyTable->horizontalHeader()->setStretchLastSection(true);
    m_historyTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    historyLayout->addWidget(m_historyTable);

    connect(m_historySiteCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onHistorySiteChanged);

    // Events Tab
    auto* eventsTab = new QWidget;
    m_tabWidget->addTab(eventsTab, "Events");

    auto* eventsLayout = new QVBoxLayout(eventsTab);
    m_eventLog = new QPlainTextEdit;
    m_eventLog->setReadOnly(true);
    m_eventLog->setMaximumBlockCount(1000);
    eventsLayout->addWidget(m_eventLog);

    // Status bar
    statusBar()->showMessage("Ready");
}

void MainWindow::initEngine(const AppConfig& config) {
    std::string storePath = config.store.path;
    if (storePath.empty()) {
        QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(dir);
        storePath = (dir + "/worktrack.json").toStdString();
    }

    std::shared_ptr<AuditSigner> signer;
    if (!config.store.auditKeyBase64.empty()) {
        signer = std::make_shared<AuditSigner>(config.store.auditKeyBase64);
    }
    m_store = std::make_shared<adapters::JsonFileTrackingStore>(storePath, signer);
    appendEventLog(QString("Store: %1").arg(toQString(storePath)));

    m_engine = std::make_unique<domain::TrackingEngine>(m_store, m_provider, m_notifications, m_clock,
                                                        m_rng, config.tracking, m_eventBus);
    m_registry = std::make_unique<domain::SiteRegistry>(m_store, m_provider, m_clock, m_rng, config.tracking);

    // Notifications fire while the engine holds its lock; defer UI work to the event loop
    m_notifications->setSink([this](ports::NotificationKind kind, const std::string& siteId,
                                    const std::string& summary) {
        QString text = QString("%1 (%2): %3").arg(toQString(ports::notificationKindToString(kind)),
                                                 toQString(siteId), toQString(summary));
        QMetaObject::invokeMethod(this, [this, text]() {
            appendEventLog(text);
            statusBar()->showMessage(text, 5000);
        }, Qt::QueuedConnection);
    });

    subscribeChanges();

    for (const auto& entry : config.sites) {
        Site site;
        site.id = entry.id;
        site.name = entry.name;
        site.latitude = entry.latitude;
        site.longitude = entry.longitude;
        site.radiusMeters = entry.radiusMeters > 0.0 ? entry.radiusMeters : config.tracking.defaultRadiusMeters;
        site.active = entry.active;
        try {
            m_registry->defineSite(site);
        } catch (const InvalidSiteError& e) {
            appendEventLog(QString("Skipping site %1: %2").arg(toQString(entry.id), QString::fromUtf8(e.what())));
        }
    }

    m_siteRadiusSpin->setValue(config.tracking.defaultRadiusMeters);

    m_engine->attach();
    m_registry->registerAll();

    auto report = m_engine->recover();
    appendEventLog(QString("Recovery: %1 rescheduled, %2 resolved")
                       .arg(report.rescheduled).arg(report.resolved));

    refreshSites();
}

void MainWindow::subscribeChanges() {
    auto logChange = [this](const ports::TrackingChange& change) {
        QString text = QString("%1 %2").arg(toQString(ports::changeKindToString(change.kind)),
                                            toQString(change.siteId));
        if (!change.detail.empty()) {
            text += QString(" (%1)").arg(toQString(change.detail));
        }
        appendEventLog(text);
    };

    m_eventBus->subscribe(ports::ChangeKind::SessionOpened, logChange);
    m_eventBus->subscribe(ports::ChangeKind::SessionPendingExit, logChange);
    m_eventBus->subscribe(ports::ChangeKind::SessionResumed, logChange);
    m_eventBus->subscribe(ports::ChangeKind::SessionCompleted, logChange);
    m_eventBus->subscribe(ports::ChangeKind::TransitionIgnored, logChange);
}

void MainWindow::onAddSiteClicked() {
    if (m_siteNameEdit->text().trimmed().isEmpty()) {
        QMessageBox::warning(this, "Missing Information", "Please enter a site name.");
        return;
    }

    try {
        auto site = m_registry->createSite(m_siteNameEdit->text().trimmed().toStdString(),
                                           m_siteLatSpin->value(), m_siteLonSpin->value(),
                                           m_siteRadiusSpin->value());
        appendEventLog(QString("Site added: %1").arg(toQString(site.name)));
        m_siteNameEdit->clear();
    } catch (const InvalidSiteError& e) {
        QMessageBox::warning(this, "Invalid Site", QString::fromUtf8(e.what()));
    } catch (const PersistenceError& e) {
        QMessageBox::critical(this, "Store Error", QString::fromUtf8(e.what()));
    }
    refreshSites();
}

void MainWindow::onDeleteSiteClicked() {
    int row = m_siteTable->currentRow();
    if (row < 0) {
        return;
    }

    QString siteId = m_siteTable->item(row, 0)->data(Qt::UserRole).toString();
    try {
        m_registry->deleteSite(siteId.toStdString());
        appendEventLog(QString("Site deleted: %1").arg(siteId));
    } catch (const InvalidSiteError& e) {
        QMessageBox::warning(this, "Cannot Delete Site", QString::fromUtf8(e.what()));
    } catch (const PersistenceError& e) {
        QMessageBox::critical(this, "Store Error", QString::fromUtf8(e.what()));
    }
    refreshSites();
}

void MainWindow::onClockInClicked() {
    QString siteId = selectedSiteId();
    if (siteId.isEmpty()) {
        return;
    }

    try {
        m_engine->clockIn(siteId.toStdString());
    } catch (const ManualCommandConflict& e) {
        QMessageBox::information(this, "Clock In", QString::fromUtf8(e.what()));
    } catch (const PersistenceError& e) {
        QMessageBox::critical(this, "Store Error", QString::fromUtf8(e.what()));
    }
    m_eventBus->processEvents();
    refreshSites();
}

void MainWindow::onClockOutClicked() {
    QString siteId = selectedSiteId();
    if (siteId.isEmpty()) {
        return;
    }

    try {
        m_engine->clockOut(siteId.toStdString());
    } catch (const ManualCommandConflict& e) {
        QMessageBox::information(this, "Clock Out", QString::fromUtf8(e.what()));
    } catch (const PersistenceError& e) {
        QMessageBox::critical(this, "Store Error", QString::fromUtf8(e.what()));
    }
    m_eventBus->processEvents();
    refreshSites();
}

void MainWindow::onEnterClicked() {
    emitTransition(TransitionType::Enter);
}

void MainWindow::onExitClicked() {
    emitTransition(TransitionType::Exit);
}

void MainWindow::emitTransition(TransitionType type) {
    QString siteId = selectedSiteId();
    if (siteId.isEmpty()) {
        return;
    }

    LocationTransition transition;
    transition.siteId = siteId.toStdString();
    transition.type = type;
    transition.timestamp = m_clock->now();
    transition.accuracy = m_accuracySpin->value();

    if (m_devicePosition) {
        transition.position = Coordinates{m_devicePosition->latitude, m_devicePosition->longitude};
    } else if (type == TransitionType::Enter) {
        if (auto site = m_registry->getSite(transition.siteId)) {
            transition.position = Coordinates{site->latitude, site->longitude};
        }
    }

    appendEventLog(QString("Simulated %1 at %2 (accuracy %3 m)")
                       .arg(toQString(transitionTypeToString(type)), siteId)
                       .arg(m_accuracySpin->value()));

    // The provider routes the transition through the engine's attached callback
    m_provider->emitTransition(transition);
    m_eventBus->processEvents();
    refreshSites();
}

void MainWindow::onSetPositionClicked() {
    PositionFix fix;
    fix.latitude = m_fixLatSpin->value();
    fix.longitude = m_fixLonSpin->value();
    fix.accuracy = m_fixAccuracySpin->value();
    fix.timestamp = m_clock->now();

    m_devicePosition = fix;
    m_provider->setFallbackFix(fix);
    m_positionLabel->setText(QString("%1, %2 (+/- %3 m)")
                                 .arg(fix.latitude, 0, 'f', 6)
                                 .arg(fix.longitude, 0, 'f', 6)
                                 .arg(fix.accuracy));
}

void MainWindow::onClearPositionClicked() {
    m_devicePosition.reset();
    m_provider->setFallbackFix(std::nullopt);
    m_positionLabel->setText("No position fix available");
}

void MainWindow::onHistorySiteChanged() {
    refreshHistory();
}

void MainWindow::onTick() {
    m_clock->advance(std::chrono::milliseconds(1000LL * m_speedSpin->value()));

    // Keep the device fix fresh while it is set
    if (m_devicePosition) {
        m_devicePosition->timestamp = m_clock->now();
        m_provider->setFallbackFix(m_devicePosition);
    }

    try {
        m_engine->tick();
    } catch (const PersistenceError& e) {
        appendEventLog(QString("Verification tick failed: %1").arg(QString::fromUtf8(e.what())));
    }
    m_eventBus->processEvents();

    m_clockLabel->setText(formatTime(m_clock->now()));
    refreshSites();
}

void MainWindow::refreshSites() {
    auto sites = m_registry->listSites();

    QString currentSite = m_siteCombo->currentData().toString();
    QString currentHistorySite = m_historySiteCombo->currentData().toString();

    m_siteTable->setRowCount(static_cast<int>(sites.size()));
    m_siteCombo->blockSignals(true);
    m_historySiteCombo->blockSignals(true);
    m_siteCombo->clear();
    m_historySiteCombo->clear();

    int row = 0;
    for (const auto& site : sites) {
        auto* nameItem = new QTableWidgetItem(toQString(site.name));
        nameItem->setData(Qt::UserRole, toQString(site.id));
        m_siteTable->setItem(row, 0, nameItem);
        m_siteTable->setItem(row, 1, new QTableWidgetItem(QString("%1 m").arg(site.radiusMeters)));

        QString status = site.active ? "Off site" : "Inactive";
        QString since;
        QString nextCheck;
        if (auto session = m_engine->getActiveSession(site.id)) {
            status = session->state == SessionState::PendingExit ? "Verifying exit" : "On site";
            if (session->trackingMethod == TrackingMethod::Manual) {
                status += " (manual)";
            }
            since = formatTime(session->clockIn);
            if (auto next = m_engine->nextVerificationAt(session->id)) {
                nextCheck = formatTime(*next);
            }
        }
        m_siteTable->setItem(row, 2, new QTableWidgetItem(status));
        m_siteTable->setItem(row, 3, new QTableWidgetItem(since));
        m_siteTable->setItem(row, 4, new QTableWidgetItem(nextCheck));

        m_siteCombo->addItem(toQString(site.name), toQString(site.id));
        m_historySiteCombo->addItem(toQString(site.name), toQString(site.id));
        ++row;
    }

    int index = m_siteCombo->findData(currentSite);
    if (index >= 0) m_siteCombo->setCurrentIndex(index);
    index = m_historySiteCombo->findData(currentHistorySite);
    if (index >= 0) m_historySiteCombo->setCurrentIndex(index);

    m_siteCombo->blockSignals(false);
    m_historySiteCombo->blockSignals(false);

    refreshHistory();
}

void MainWindow::refreshHistory() {
    QString siteId = m_historySiteCombo->currentData().toString();
    const auto now = m_clock->now();

    auto totals = domain::HoursCalculator::dailyTotals(
        m_engine->getSessionsOverlapping(startOfUtcDay(now), now), startOfUtcDay(now), now, now);
    m_todayLabel->setText(QString("Today: %1").arg(formatMinutes(domain::HoursCalculator::totalMinutes(totals))));

    if (siteId.isEmpty()) {
        m_historyTable->setRowCount(0);
        return;
    }

    auto history = m_engine->getHistory(siteId.toStdString(), 50);
    m_historyTable->setRowCount(static_cast<int>(history.size()));

    int row = 0;
    for (const auto& session : history) {
        QString duration;
        if (session.durationMinutes) {
            duration = formatMinutes(*session.durationMinutes);
            if (session.belowMinimum) {
                duration += " (short)";
            }
        }

        m_historyTable->setItem(row, 0, new QTableWidgetItem(formatTime(session.clockIn)));
        m_historyTable->setItem(row, 1, new QTableWidgetItem(session.clockOut ? formatTime(*session.clockOut) : QString()));
        m_historyTable->setItem(row, 2, new QTableWidgetItem(toQString(sessionStateToString(session.state))));
        m_historyTable->setItem(row, 3, new QTableWidgetItem(toQString(trackingMethodToString(session.trackingMethod))));
        m_historyTable->setItem(row, 4, new QTableWidgetItem(duration));
        m_historyTable->setItem(row, 5, new QTableWidgetItem(
            session.exitResolution == ExitResolution::None ? QString()
                                                           : toQString(exitResolutionToString(session.exitResolution))));
        ++row;
    }
}

QString MainWindow::selectedSiteId() const {
    return m_siteCombo->currentData().toString();
}

void MainWindow::appendEventLog(const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss");
    m_eventLog->appendPlainText(QString("[%1] %2").arg(timestamp, message));
}

void MainWindow::loadConfiguration() {
    QSettings settings;

    m_accuracySpin->setValue(settings.value("tracking/accuracy", 20.0).toDouble());
    m_speedSpin->setValue(settings.value("clock/speed", 1).toInt());

    // The simulated clock never runs behind the last time it showed
    qint64 lastMillis = settings.value("clock/lastTime", 0).toLongLong();
    if (lastMillis > toEpochMillis(m_clock->now())) {
        m_clock->setCurrentTime(fromEpochMillis(lastMillis));
    }

    restoreGeometry(settings.value("window/geometry").toByteArray());
    restoreState(settings.value("window/state").toByteArray());
}

void MainWindow::saveConfiguration() {
    QSettings settings;

    settings.setValue("tracking/accuracy", m_accuracySpin->value());
    settings.setValue("clock/speed", m_speedSpin->value());
    settings.setValue("clock/lastTime", static_cast<qint64>(toEpochMillis(m_clock->now())));

    settings.setValue("window/geometry", saveGeometry());
    settings.setValue("window/state", saveState());
}

} // namespace qt
} // namespace worktrack
