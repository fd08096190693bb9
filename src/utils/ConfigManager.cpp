#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <usb-audio/Constants.hpp>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <cmath>

namespace usb_audio {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> globalSettings;
    std::map<std::string, std::map<std::string, ConfigValue>> deviceSettings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    // JSON has a single number type; whole numbers come back as int.
    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue(json.toBool());
            case QJsonValue::Double: {
                double number = json.toDouble();
                double whole = 0.0;
                if (std::modf(number, &whole) == 0.0 && std::fabs(number) <= 2147483647.0) {
                    return ConfigValue(static_cast<int>(number));
                }
                return ConfigValue(number);
            }
            case QJsonValue::String:
                return ConfigValue(json.toString().toStdString());
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        globalSettings = {
            {"rulesFile", std::string(DEFAULT_RULES_FILE)},
            {"sysfsUsbRoot", std::string(DEFAULT_SYSFS_USB_ROOT)},
            {"asoundRoot", std::string(DEFAULT_ASOUND_ROOT)},
            {"procRoot", std::string(DEFAULT_PROC_ROOT)},
            {"udevadmPath", std::string("udevadm")},
            {"arecordPath", std::string("arecord")},
            {"ffmpegPath", std::string("ffmpeg")},
            {"streamHost", std::string("localhost")},
            {"streamPort", DEFAULT_STREAM_PORT},
            {"audioCodec", std::string("libmp3lame")},
            {"audioBitrate", std::string("160k")},
            {"inputChannels", 1},
            {"outputChannels", 2},
            {"rtspTransport", std::string("tcp")},
            {"staggerDelayMs", STAGGER_DELAY},
            {"rescanIntervalMs", RESCAN_INTERVAL},
            {"hotplugSettleMs", HOTPLUG_SETTLE},
            {"stopTimeoutMs", STOP_TIMEOUT},
            {"statusFile", std::string(DEFAULT_STATUS_FILE)},
            {"extraDenylist", std::string()},
            {"logLevel", 1}
        };
    }

    std::map<std::string, ConfigValue> readSection(const QJsonObject& section,
                                                   const std::string& name) const {
        std::map<std::string, ConfigValue> values;
        for (auto it = section.begin(); it != section.end(); ++it) {
            auto value = fromJsonValue(it.value());
            if (!value) {
                LOG_WARNING("Ignoring unsupported value for '" + it.key().toStdString() +
                            "' in " + name);
                continue;
            }
            values[it.key().toStdString()] = *value;
        }
        return values;
    }

    std::string makeDeviceKey(const std::string& vendorId, const std::string& productId) const {
        return vendorId + ":" + productId;
    }

    const ConfigValue* deviceValue(const std::string& vendorId, const std::string& productId,
                                   const std::string& key) const {
        auto device = deviceSettings.find(makeDeviceKey(vendorId, productId));
        if (device == deviceSettings.end()) {
            return nullptr;
        }
        auto it = device->second.find(key);
        return it == device->second.end() ? nullptr : &it->second;
    }
};

ConfigManager::ConfigManager()
    : d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<bool>(it->second)) {
            return std::get<bool>(it->second);
        }
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<std::string>(it->second)) {
            return std::get<std::string>(it->second);
        }
    }
    return defaultValue;
}

std::vector<std::string> ConfigManager::getList(const std::string& key) const {
    std::vector<std::string> items;
    const QStringList parts = QString::fromStdString(getString(key))
        .split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        QString item = part.trimmed();
        if (!item.isEmpty()) {
            items.push_back(item.toStdString());
        }
    }
    return items;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->globalSettings[key] = value;
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->globalSettings[key] = value;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
}

std::map<std::string, ConfigValue> ConfigManager::getDeviceSettings(
    const std::string& vendorId, const std::string& productId) const {
    auto it = d->deviceSettings.find(d->makeDeviceKey(vendorId, productId));
    if (it != d->deviceSettings.end()) {
        return it->second;
    }
    return {};
}

void ConfigManager::setDeviceSettings(
    const std::string& vendorId, const std::string& productId,
    const std::map<std::string, ConfigValue>& settings) {
    d->deviceSettings[d->makeDeviceKey(vendorId, productId)] = settings;
}

int ConfigManager::deviceInt(const std::string& vendorId, const std::string& productId,
                             const std::string& key) const {
    const ConfigValue* value = d->deviceValue(vendorId, productId, key);
    if (value && std::holds_alternative<int>(*value)) {
        return std::get<int>(*value);
    }
    return getInt(key);
}

std::string ConfigManager::deviceString(const std::string& vendorId, const std::string& productId,
                                        const std::string& key) const {
    const ConfigValue* value = d->deviceValue(vendorId, productId, key);
    if (value && std::holds_alternative<std::string>(*value)) {
        return std::get<std::string>(*value);
    }
    return getString(key);
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR("Cannot open config file " + filename + ": " + file.errorString().toStdString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_ERROR("Malformed config file " + filename + ": " +
                  parseError.errorString().toStdString());
        return false;
    }

    QJsonObject root = doc.object();

    QJsonObject globals = root["global"].toObject();
    for (const auto& [key, value] : d->readSection(globals, "global")) {
        d->globalSettings[key] = value;
    }

    QJsonObject devices = root["devices"].toObject();
    for (auto it = devices.begin(); it != devices.end(); ++it) {
        std::string deviceKey = it.key().toLower().toStdString();
        d->deviceSettings[deviceKey] = d->readSection(it.value().toObject(), deviceKey);
    }

    LOG_INFO("Loaded configuration from " + filename);
    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject root;

    QJsonObject globals;
    for (const auto& [key, value] : d->globalSettings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }
    root["global"] = globals;

    QJsonObject devices;
    for (const auto& [deviceKey, settings] : d->deviceSettings) {
        QJsonObject deviceSettings;
        for (const auto& [key, value] : settings) {
            deviceSettings[QString::fromStdString(key)] = d->toJsonValue(value);
        }
        devices[QString::fromStdString(deviceKey)] = deviceSettings;
    }
    root["devices"] = devices;

    QString path = QString::fromStdString(filename);
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Cannot write config file " + filename);
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    return file.commit();
}

std::vector<std::string> ConfigManager::searchPaths() {
    std::vector<std::string> paths;
    paths.push_back(QDir::current().filePath(QStringLiteral("usb-audio-rtsp.json")).toStdString());
    const QString home = QDir::homePath();
    if (!home.isEmpty()) {
        paths.push_back((home + QStringLiteral("/.config/usb-audio-rtsp/config.json")).toStdString());
    }
    paths.push_back("/etc/usb-audio-rtsp/config.json");
    return paths;
}

std::optional<std::string> ConfigManager::locateConfigFile() {
    for (const auto& path : searchPaths()) {
        if (QFileInfo(QString::fromStdString(path)).isFile()) {
            return path;
        }
    }
    return std::nullopt;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();
    d->deviceSettings.clear();
}

}
