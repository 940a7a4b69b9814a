#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>

#include "tforge/app_config.hpp"
#include "tforge/console_frontend.hpp"
#include "tforge/telemetry.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("TweakForge");
    app.setOrganizationName("TweakForge");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Builds and installs Theos tweak projects.\n\n" + tforge::ConsoleFrontend::usage());
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(
        {"c", "config"},
        "Read configuration from <file> instead of ./tforge.json.",
        "file");
    parser.addOption(configOption);
    parser.addPositionalArgument("command", "Command to run, followed by its operands.");
    parser.process(app);

    tforge::AppConfig config = tforge::AppConfig::defaults();
    QString configPath = parser.value(configOption);
    if (configPath.isEmpty() && QFileInfo::exists("tforge.json")) {
        configPath = "tforge.json";
    }
    if (!configPath.isEmpty()) {
        const QJsonObject loaded = tforge::AppConfig::loadFromFile(configPath, &config);
        if (!loaded.value("success").toBool(false)) {
            QTextStream(stderr) << "error: " << loaded.value("error").toString() << " ("
                                << configPath << ")\n";
            return 2;
        }
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&config]() {
        const QString path = QDir(QDir::currentPath()).filePath(config.telemetryExportPath);
        tforge::Telemetry::instance().exportToFile(path);
    });

    tforge::ConsoleFrontend frontend(config);
    const QStringList arguments = parser.positionalArguments();
    QTimer::singleShot(0, &frontend, [&frontend, arguments]() {
        QCoreApplication::exit(frontend.run(arguments));
    });

    return QCoreApplication::exec();
}
