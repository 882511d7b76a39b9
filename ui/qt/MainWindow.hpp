#pragma once

#include <QMainWindow>
#include <QTimer>
#include <QPlainTextEdit>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QComboBox>
#include <QLabel>
#include <QTableWidget>
#include <QTabWidget>

#include "UiNotificationDispatcher.hpp"
#include "../../core/domain/EventBus.hpp"
#include "../../core/domain/SiteRegistry.hpp"
#include "../../core/domain/TrackingEngine.hpp"
#include "../../core/sim/MockLocationProvider.hpp"
#include "../../core/sim/SimulatedClock.hpp"
#include "../../platform/desktop/TomlConfig.hpp"
#include <memory>
#include <optional>

namespace worktrack {
namespace qt {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const AppConfig& config, QWidget *parent = nullptr);
    ~MainWindow() override;

private slots:
    void onAddSiteClicked();
    void onDeleteSiteClicked();
    void onClockInClicked();
    void onClockOutClicked();
    void onEnterClicked();
    void onExitClicked();
    void onSetPositionClicked();
    void onClearPositionClicked();
    void onHistorySiteChanged();
    void onTick();

private:
    void setupUI();
    void initEngine(const AppConfig& config);
    void subscribeChanges();
    void emitTransition(TransitionType type);
    void refreshSites();
    void refreshHistory();
    void appendEventLog(const QString& message);
    QString selectedSiteId() const;
    void loadConfiguration();
    void saveConfiguration();

    // UI Components
    QTabWidget* m_tabWidget;

    // Sites tab
    QTableWidget* m_siteTable;
    QLineEdit* m_siteNameEdit;
    QDoubleSpinBox* m_siteLatSpin;
    QDoubleSpinBox* m_siteLonSpin;
    QDoubleSpinBox* m_siteRadiusSpin;
    QPushButton* m_addSiteButton;
    QPushButton* m_deleteSiteButton;

    // Tracking tab
    QComboBox* m_siteCombo;
    QPushButton* m_clockInButton;
    QPushButton* m_clockOutButton;
    QPushButton* m_enterButton;
    QPushButton* m_exitButton;
    QDoubleSpinBox* m_accuracySpin;
    QDoubleSpinBox* m_fixLatSpin;
    QDoubleSpinBox* m_fixLonSpin;
    QDoubleSpinBox* m_fixAccuracySpin;
    QPushButton* m_setPositionButton;
    QPushButton* m_clearPositionButton;
    QSpinBox* m_speedSpin;
    QLabel* m_clockLabel;
    QLabel* m_positionLabel;

    // History tab
    QComboBox* m_historySiteCombo;
    QTableWidget* m_historyTable;
    QLabel* m_todayLabel;

    // Events tab
    QPlainTextEdit* m_eventLog;

    // Tracking components
    std::shared_ptr<sim::SimulatedClock> m_clock;
    std::shared_ptr<IRng> m_rng;
    std::shared_ptr<sim::MockLocationProvider> m_provider;
    std::shared_ptr<UiNotificationDispatcher> m_notifications;
    std::shared_ptr<domain::EventBus> m_eventBus;
    std::shared_ptr<ports::ITrackingStore> m_store;
    std::unique_ptr<domain::TrackingEngine> m_engine;
    std::unique_ptr<domain::SiteRegistry> m_registry;

    std::optional<PositionFix> m_devicePosition;
    QTimer* m_tickTimer;
};

} // namespace qt
} // namespace worktrack
