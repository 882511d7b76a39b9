#include <QApplication>
#include <QMessageBox>
#include "MainWindow.hpp"
#include "../../core/Errors.hpp"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("Work Tracking Monitor");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("worktrack");

    QString configFile = "worktrack.toml";
    const QStringList args = app.arguments();
    int configIndex = args.indexOf("--config");
    if (configIndex >= 0 && configIndex + 1 < args.size()) {
        configFile = args.at(configIndex + 1);
    }

    auto config = worktrack::TomlConfig::loadFromFile(configFile.toStdString());

    try {
        worktrack::qt::MainWindow window(config);
        window.show();
        return app.exec();
    } catch (const worktrack::PersistenceError& e) {
        QMessageBox::critical(nullptr, "Store Error", QString::fromUtf8(e.what()));
    } catch (const std::invalid_argument& e) {
        QMessageBox::critical(nullptr, "Invalid Configuration", QString::fromUtf8(e.what()));
    }
    return 1;
}
