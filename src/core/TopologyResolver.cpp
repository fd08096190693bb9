#include "TopologyResolver.hpp"
#include "Logger.hpp"
#include "OutputParsers.hpp"
#include "SystemQuery.hpp"
#include "../security/Fingerprint.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace usb_audio {

namespace {

std::optional<std::string> readAttribute(const QString& node, const char* name) {
    QFile file(node + QLatin1Char('/') + QLatin1String(name));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QString value = QString::fromUtf8(file.readAll()).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value.toStdString();
}

std::optional<int> readNumber(const QString& node, const char* name) {
    auto text = readAttribute(node, name);
    if (!text) {
        return std::nullopt;
    }
    return parsers::parseDecimal(QString::fromStdString(*text));
}

std::string deviceLabel(int bus, int dev) {
    return "bus " + std::to_string(bus) + " device " + std::to_string(dev);
}

}

class TopologyResolver::Private {
public:
    ResolverPaths paths;
    const SystemQuery& query;

    Private(const ResolverPaths& p, const SystemQuery& q)
        : paths(p), query(q) {}

    // A node whose busnum/devnum disagree is a different device.
    bool nodeBelongsTo(const QString& node, int bus, int dev) const {
        auto nodeBus = readNumber(node, "busnum");
        auto nodeDev = readNumber(node, "devnum");
        if (nodeBus && *nodeBus != bus) return false;
        if (nodeDev && *nodeDev != dev) return false;
        return true;
    }

    QString findNodeByNumbers(int bus, int dev) const {
        QDir root(paths.sysfsUsbRoot);
        const QStringList entries = root.entryList(
            QDir::Dirs | QDir::NoDotAndDotDot | QDir::System, QDir::Name);

        for (const QString& entry : entries) {
            QString node = root.filePath(entry);
            auto nodeBus = readNumber(node, "busnum");
            auto nodeDev = readNumber(node, "devnum");
            if (nodeBus && nodeDev && *nodeBus == bus && *nodeDev == dev) {
                return node;
            }
        }
        return {};
    }

    QString deviceNode(int bus, int dev) const {
        return QStringLiteral("%1/%2/%3")
            .arg(paths.devBusUsbRoot)
            .arg(bus, 3, 10, QLatin1Char('0'))
            .arg(dev, 3, 10, QLatin1Char('0'));
    }

    void captureIdentityAttributes(const QString& node, PortIdentity& identity) const {
        if (!identity.serial) {
            identity.serial = readAttribute(node, "serial");
            if (identity.serial) {
                LOG_DEBUG("Found serial from sysfs: " + *identity.serial);
            }
        }
        if (!identity.productName) {
            identity.productName = readAttribute(node, "product");
            if (identity.productName) {
                LOG_DEBUG("Found product name from sysfs: " + *identity.productName);
            }
        }
    }

    void queryDeviceManager(int bus, int dev, PortIdentity& identity) const {
        const QString node = deviceNode(bus, dev);
        auto devicePath = parsers::parseUdevPath(
            query.run(paths.udevadmPath, {QStringLiteral("info"), QStringLiteral("-q"),
                                          QStringLiteral("path"), QStringLiteral("-n"), node}));
        if (!devicePath) {
            LOG_DEBUG("udevadm reported no path for " + node.toStdString());
            return;
        }
        LOG_DEBUG("Found udevadm path: " + *devicePath);

        auto properties = parsers::parseUdevProperties(
            query.run(paths.udevadmPath, {QStringLiteral("info"), QStringLiteral("-n"), node,
                                          QStringLiteral("--query=property")}));

        auto property = [&properties](const char* key) -> std::optional<std::string> {
            auto it = properties.find(key);
            if (it == properties.end() || it->second.empty()) {
                return std::nullopt;
            }
            return it->second;
        };

        if (!identity.serial) {
            identity.serial = property("ID_SERIAL");
        }
        if (!identity.productName) {
            identity.productName = property("ID_MODEL");
        }

        std::optional<std::string> port;
        if (auto devpath = property("DEVPATH")) {
            QString qDevpath = QString::fromStdString(*devpath);
            port = parsers::trailingPortFragment(qDevpath);
            if (!port) {
                port = parsers::hyphenatedLeafName(qDevpath);
            }
        }
        if (!port) {
            QString qDevicePath = QString::fromStdString(*devicePath);
            port = parsers::trailingPortFragment(qDevicePath);
            if (!port) {
                port = parsers::findPortFragment(qDevicePath);
            }
        }

        if (port) {
            identity.portPath = *port;
            identity.source = PortSource::DeviceManager;
            LOG_DEBUG("Port " + *port + " for " + deviceLabel(bus, dev) +
                     " from udevadm (confidence: low)");
        }
    }
};

TopologyResolver::TopologyResolver(const ResolverPaths& paths, const SystemQuery& query)
    : d(std::make_unique<Private>(paths, query)) {
}

TopologyResolver::~TopologyResolver() = default;

std::optional<PortIdentity> TopologyResolver::resolvePort(int busNumber, int deviceNumber) const {
    if (busNumber <= 0 || deviceNumber <= 0) {
        LOG_WARNING("Missing bus or device number for port detection");
        return std::nullopt;
    }

    const std::string label = deviceLabel(busNumber, deviceNumber);
    PortIdentity identity;

    // Devices behind a root hub port are commonly named bus-bus.dev.
    const QDir root(d->paths.sysfsUsbRoot);
    const QStringList candidates = {
        QStringLiteral("%1-%2").arg(busNumber).arg(deviceNumber),
        QStringLiteral("%1-%1.%2").arg(busNumber).arg(deviceNumber)
    };
    QString node;
    bool directNode = false;
    for (const auto& candidate : candidates) {
        node = root.filePath(candidate);
        if (QFileInfo(node).isDir() && d->nodeBelongsTo(node, busNumber, deviceNumber)) {
            directNode = true;
            break;
        }
    }

    if (!directNode) {
        LOG_DEBUG("No direct topology node for " + label + ", scanning " +
                  d->paths.sysfsUsbRoot.toStdString());
        node = d->findNodeByNumbers(busNumber, deviceNumber);
        if (!node.isEmpty()) {
            LOG_DEBUG("Found device through scan: " + node.toStdString());
        }
    }

    if (!node.isEmpty()) {
        if (auto devpath = readAttribute(node, "devpath")) {
            identity.portPath = std::to_string(busNumber) + "-" + *devpath;
            identity.source = PortSource::Devpath;
            LOG_DEBUG("Port " + identity.portPath + " for " + label +
                     " from devpath attribute (confidence: high)");
        }

        d->captureIdentityAttributes(node, identity);

        QString canonical = QFileInfo(node).canonicalFilePath();
        identity.canonicalNodePath = canonical.toStdString();
        if (!canonical.isEmpty()) {
            LOG_DEBUG("Found sysfs device path: " + identity.canonicalNodePath);
        }

        if (identity.portPath.empty() && !canonical.isEmpty()) {
            if (auto fragment = parsers::trailingPortFragment(canonical)) {
                identity.portPath = *fragment;
                identity.source = PortSource::CanonicalPath;
                LOG_DEBUG("Port " + *fragment + " for " + label +
                         " from topology path (confidence: medium)");
            } else if (auto leaf = parsers::hyphenatedLeafName(canonical)) {
                identity.portPath = *leaf;
                identity.source = PortSource::NodeName;
                LOG_DEBUG("Port " + *leaf + " for " + label +
                         " from node name (confidence: low)");
            }
        }
    }

    if (identity.portPath.empty()) {
        d->queryDeviceManager(busNumber, deviceNumber, identity);
    }

    if (identity.portPath.empty()) {
        identity.portPath = synthesizedPortPath(busNumber, deviceNumber);
        identity.source = PortSource::Synthesized;
        LOG_WARNING("No topology information for " + label +
                    ", using synthetic port " + identity.portPath + " (confidence: fallback)");
    }

    identity.uniquenessToken = uniquenessToken(
        busNumber, deviceNumber, identity.serial, identity.productName);

    LOG_DEBUG("Resolved " + label + " to " + identity.identifier());
    return identity;
}

std::string TopologyResolver::uniquenessToken(int busNumber,
                                              int deviceNumber,
                                              const std::optional<std::string>& serial,
                                              const std::optional<std::string>& productName) {
    if (serial && !serial->empty()) {
        return serial->substr(0, SERIAL_TOKEN_LENGTH);
    }

    std::string input = "bus" + std::to_string(busNumber) + "dev" + std::to_string(deviceNumber);
    if (productName) {
        input += *productName;
    }
    std::string stamp = highResolutionStamp();
    input += stamp;

    std::string token = shortDigest(input, HASH_TOKEN_LENGTH);
    if (token.empty()) {
        token = stamp.substr(stamp.size() > HASH_TOKEN_LENGTH ? stamp.size() - HASH_TOKEN_LENGTH : 0);
    }
    return token;
}

std::string TopologyResolver::synthesizedPortPath(int busNumber, int deviceNumber) {
    return "usb-bus" + std::to_string(busNumber) + "-port" + std::to_string(deviceNumber);
}

}
