#include "AppSetup.hpp"
#include "../core/Logger.hpp"
#include "../utils/ConfigManager.hpp"
#include <QCommandLineOption>
#include <QCommandLineParser>

namespace usb_audio {

void addCommonOptions(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "file"));
    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Also write log messages to this file.",
        "file"));
    parser.addOption(QCommandLineOption(
        QStringList() << "V" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level"));
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    if (parser.isSet("config")) {
        return config.loadFromFile(parser.value("config").toStdString());
    }

    if (auto path = ConfigManager::locateConfigFile()) {
        return config.loadFromFile(*path);
    }

    LOG_DEBUG("No configuration file found, using defaults");
    return true;
}

void initializeLogger(const QCommandLineParser& parser, const ConfigManager& config, bool forceDebug) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    int level = config.getInt("logLevel", 1);
    if (parser.isSet("verbosity")) {
        bool ok = false;
        int requested = parser.value("verbosity").toInt(&ok);
        if (ok) {
            level = requested;
        } else {
            LOG_WARNING("Ignoring invalid verbosity '" + parser.value("verbosity").toStdString() + "'");
        }
    }
    logger.setLogLevel(forceDebug ? LogLevel::Debug : Logger::levelFromInt(level));
}

}
