#pragma once

class QCommandLineParser;

namespace usb_audio {

class ConfigManager;

// -c/--config, -l/--log-file and -V/--verbosity, shared by both tools.
void addCommonOptions(QCommandLineParser& parser);

// An explicit -c file must load; otherwise the first file on the search
// path is used, or the defaults when there is none.
bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser);

// -V wins over the logLevel key; forceDebug wins over both.
void initializeLogger(const QCommandLineParser& parser, const ConfigManager& config,
                      bool forceDebug = false);

}
